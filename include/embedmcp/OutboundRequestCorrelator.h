//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutboundRequestCorrelator.h
// Purpose: Tracks server-initiated requests and matches client responses to waiters
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "embedmcp/JSONRPCTypes.h"

namespace embedmcp {

class BackgroundScheduler;

//==========================================================================================================
// RetryPolicy
// Purpose: Bounded exponential backoff for IssueWithRetry.
// Fields:
//   maxAttempts: Total attempts including the first (>= 1).
//   initialDelay: Delay before the second attempt.
//   maxDelay: Upper bound for any single delay.
//   multiplier: Growth factor applied after each failed attempt.
//==========================================================================================================
struct RetryPolicy {
    unsigned maxAttempts{3};
    std::chrono::milliseconds initialDelay{250};
    std::chrono::milliseconds maxDelay{4000};
    double multiplier{2.0};

    // Delay to wait after the given failed attempt (1-based).
    std::chrono::milliseconds DelayAfter(unsigned attempt) const;
};

//==========================================================================================================
// OutboundRequestCorrelator
// Purpose: Issues JSON-RPC requests to a session and completes each waiter exactly once with the first
//          of: the client's result, the client's error, the deadline, or a channel failure.
// Notes:
//   - Ids are "srv-req-<n>" from a process-wide counter and are never reused.
//   - Deadlines are steady_timer waits on the BackgroundScheduler.
//   - Outcomes on the future:
//       value                -> result member of the response (null when the client sent "result": null)
//       errors::McpException -> client answered with an error object
//       errors::TimeoutError -> no response before the deadline
//       errors::ChannelError -> send failed, session closed, or correlator shut down
//==========================================================================================================
class OutboundRequestCorrelator {
public:
    // Writes one serialized request to a session. Returns false when the session is unknown or the
    // write could not be queued.
    using SendFunction = std::function<bool(const std::string& sessionId, const std::string& payload)>;
    using Completion = std::function<void(std::exception_ptr error, JSONValue result)>;

    OutboundRequestCorrelator(BackgroundScheduler& scheduler, SendFunction send,
                              std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(30000));
    ~OutboundRequestCorrelator();

    OutboundRequestCorrelator(const OutboundRequestCorrelator&) = delete;
    OutboundRequestCorrelator& operator=(const OutboundRequestCorrelator&) = delete;

    //==========================================================================================================
    // Issue
    // Purpose: Sends method/params to sessionId and returns a future for the outcome.
    // Args:
    //   timeout: Overrides the default deadline for this request.
    //==========================================================================================================
    std::future<JSONValue> Issue(const std::string& sessionId, const std::string& method,
                                 std::optional<JSONValue> params,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Callback form of Issue. The completion runs on the thread that resolves the request.
    void IssueAsync(const std::string& sessionId, const std::string& method,
                    std::optional<JSONValue> params, Completion completion,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // IssueWithRetry
    // Purpose: Like Issue, but re-issues with a fresh id after TimeoutError or ChannelError until the
    //          policy's attempts are used up. Client error responses are never retried.
    // Returns:
    //   Future carrying the first success or the last failure.
    //==========================================================================================================
    std::future<JSONValue> IssueWithRetry(const std::string& sessionId, const std::string& method,
                                          std::optional<JSONValue> params, const RetryPolicy& policy,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Routes a client response to its waiter. Returns false for unknown or already-resolved ids.
    bool Resolve(const JSONRPCResponse& response);

    // Fails every request pending on sessionId with ChannelError. Returns the number failed.
    std::size_t FailSession(const std::string& sessionId);

    std::size_t PendingCount() const;
    bool IsPending(const std::string& id) const;

    // Fails everything with ChannelError; later Issue calls fail immediately.
    void Shutdown();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace embedmcp
