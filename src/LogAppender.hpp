#ifndef ACCORD_LOG_APPENDER_HPP
#define ACCORD_LOG_APPENDER_HPP

/**
 * @file LogAppender.hpp
 *
 * This module declares the Accord::LogAppender class.
 *
 * © 2020 by Richard Walters
 */

#include "Message.hpp"
#include "PeerProgress.hpp"

#include <Accord/ILog.hpp>
#include <Accord/IServer.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Accord {

    /**
     * This is used by the leader to bring the log of one other server
     * up to date with its own, by sending it entries or the leader's
     * snapshot, and retransmitting requests that go unanswered.
     */
    class LogAppender {
        // Types
    public:
        /**
         * This is the interface the appender uses to reach the server
         * which owns it.
         */
        class Host {
        public:
            virtual ~Host() = default;

            virtual const IServer::ServerConfiguration& GetServerConfiguration() = 0;

            virtual uint64_t GetCurrentTerm() = 0;

            virtual size_t GetCommitIndex() = 0;

            virtual ILog& GetLog() = 0;

            /**
             * Send the given serialized message to the given server.
             */
            virtual void SendMessage(
                const std::string& serializedMessage,
                int receiverInstanceNumber
            ) = 0;

            /**
             * Arrange for the appender for the given server to be told
             * to retransmit at the given time.
             *
             * @return
             *     A token which can be used to cancel the retransmission
             *     is returned.
             */
            virtual int ScheduleRetransmission(
                int instanceId,
                double dueTime
            ) = 0;

            virtual void CancelScheduled(int token) = 0;

            /**
             * This is called when the given server stops or starts
             * answering requests.
             */
            virtual void OnPeerReachabilityChanged(
                int instanceId,
                bool reachable
            ) = 0;
        };

        // Lifecycle Methods
    public:
        ~LogAppender() noexcept;
        LogAppender(const LogAppender&) = delete;
        LogAppender(LogAppender&&) noexcept = delete;
        LogAppender& operator=(const LogAppender&) = delete;
        LogAppender& operator=(LogAppender&&) noexcept = delete;

        // Public Methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] host
         *     This is the server which owns the appender.
         *
         * @param[in] diagnosticsSender
         *     This is used to publish diagnostic messages.
         *
         * @param[in] instanceId
         *     This is the unique identifier of the server whose log
         *     the appender replicates.
         *
         * @param[in] now
         *     This is the current time.
         */
        LogAppender(
            Host& host,
            SystemAbstractions::DiagnosticsSender& diagnosticsSender,
            int instanceId,
            double now
        );

        int GetInstanceId() const;

        const PeerProgress& GetProgress() const;

        /**
         * Send the server whatever entries it lacks, or the snapshot
         * if it lacks entries no longer kept, unless a request to the
         * server is still unanswered.  If the server lacks nothing,
         * an empty AppendEntries request is sent as a heartbeat.
         *
         * @param[in] now
         *     This is the current time.
         */
        void Replicate(double now);

        /**
         * Retransmit the unanswered request, if the given token matches
         * the retransmission scheduled.
         *
         * @param[in] token
         *     This is the token of the retransmission that came due.
         *
         * @param[in] now
         *     This is the current time.
         */
        void OnRetransmitTimeout(
            int token,
            double now
        );

        /**
         * Handle the server's response to an AppendEntries request.
         *
         * @param[in] message
         *     This is the response received.
         *
         * @param[in] now
         *     This is the current time.
         *
         * @return
         *     An indication of whether or not the response answered
         *     the request outstanding is returned.
         */
        bool OnAppendEntriesResults(
            const Message& message,
            double now
        );

        /**
         * Handle the server's response to an InstallSnapshot request.
         *
         * @param[in] message
         *     This is the response received.
         *
         * @param[in] now
         *     This is the current time.
         *
         * @return
         *     An indication of whether or not the response answered
         *     the request outstanding is returned.
         */
        bool OnInstallSnapshotResults(
            const Message& message,
            double now
        );

        /**
         * Forget any outstanding request, so that the next call to
         * Replicate sends a new one.  What is known about the server's
         * log is kept.
         */
        void Restart();

        /**
         * Stop retransmitting.
         */
        void Cancel();

        /**
         * Decide whether or not the server has stopped answering,
         * letting the host know when that changes.
         *
         * @param[in] now
         *     This is the current time.
         */
        void CheckReachability(double now);

        /**
         * Return how long to wait before retransmitting a request
         * of the given type, which has already been retransmitted the
         * given number of times.
         *
         * @param[in] serverConfiguration
         *     This holds the retry policy and timeouts to use.
         *
         * @param[in] requestType
         *     This is the type of request to retransmit.
         *
         * @param[in] retransmissions
         *     This is the number of times the request has already
         *     been retransmitted.
         *
         * @return
         *     The time to wait, in seconds, is returned.
         */
        static double GetRetransmitDelay(
            const IServer::ServerConfiguration& serverConfiguration,
            Message::Type requestType,
            size_t retransmissions
        );

        // Private Methods
    private:
        bool ShouldSendSnapshot(ILog& log) const;

        void SendRequest(
            Message& message,
            double now
        );

        void ScheduleRetransmission(double now);

        bool AcceptResponse(
            const Message& message,
            double now
        );

        // Private properties
    private:
        Host& host_;

        SystemAbstractions::DiagnosticsSender& diagnosticsSender_;

        int instanceId_ = 0;

        PeerProgress progress_;

        RpcState rpc_;
    };

}

#endif /* ACCORD_LOG_APPENDER_HPP */
