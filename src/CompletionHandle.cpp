/**
 * @file CompletionHandle.cpp
 *
 * This module contains the implementation of the Accord::CompletionHandle
 * class.
 *
 * © 2020 by Richard Walters
 */

#include "CompletionHandle.hpp"

namespace Accord {

    CompletionHandle::CompletionHandle()
        : future_(promise_.get_future().share())
    {
    }

    bool CompletionHandle::Resolve(const ClientReply& reply) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        if (resolved_) {
            return false;
        }
        resolved_ = true;
        promise_.set_value(reply);
        return true;
    }

    std::shared_future< ClientReply > CompletionHandle::GetFuture() const {
        return future_;
    }

    bool CompletionHandle::IsResolved() {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        return resolved_;
    }

}
