//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutboundRequestCorrelator.cpp
// Purpose: Tracks server-initiated requests and matches client responses to waiters
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <boost/asio/async_result.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "embedmcp/OutboundRequestCorrelator.h"
#include "embedmcp/Scheduler.hpp"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace embedmcp {
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds RetryPolicy::DelayAfter(unsigned attempt) const {
    if (attempt == 0) {
        attempt = 1;
    }
    double d = static_cast<double>(initialDelay.count()) * std::pow(multiplier, static_cast<double>(attempt - 1));
    const double cap = static_cast<double>(maxDelay.count());
    if (!std::isfinite(d) || d > cap) {
        d = cap;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(d));
}

class OutboundRequestCorrelator::Impl : public std::enable_shared_from_this<Impl> {
public:
    struct Pending {
        std::string sessionId;
        std::string method;
        Clock::time_point issuedAt;
        Clock::time_point timeoutAt;
        std::unique_ptr<net::steady_timer> timer;
        Completion completion;
    };

    BackgroundScheduler& scheduler;
    SendFunction send;
    std::chrono::milliseconds defaultTimeout;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Pending> pending;
    bool shutdown{false};

    static std::atomic<std::uint64_t> nextId;

    Impl(BackgroundScheduler& s, SendFunction fn, std::chrono::milliseconds timeout)
        : scheduler(s), send(std::move(fn)), defaultTimeout(timeout) {}

    static std::string makeId() {
        return "srv-req-" + std::to_string(nextId.fetch_add(1) + 1);
    }

    // Removes the entry and disarms its deadline. Whoever gets the entry owns its completion.
    std::optional<Pending> take(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            return std::nullopt;
        }
        Pending p = std::move(it->second);
        pending.erase(it);
        if (p.timer) {
            p.timer->cancel();
        }
        return p;
    }

    static void complete(Pending& p, std::exception_ptr error, JSONValue value) {
        if (!p.completion) {
            return;
        }
        try {
            p.completion(error, std::move(value));
        } catch (const std::exception& e) {
            LOG_ERROR("Outbound completion threw: {}", e.what());
        }
    }

    void expire(const std::string& id) {
        auto p = take(id);
        if (!p.has_value()) {
            return;
        }
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - p->issuedAt);
        LOG_WARN("Outbound request {} ({}) to {} timed out after {}ms", id, p->method, p->sessionId, waited.count());
        complete(*p, std::make_exception_ptr(errors::TimeoutError(
                         "Request " + id + " (" + p->method + ") timed out")), JSONValue());
    }

    void issue(const std::string& sessionId, const std::string& method, std::optional<JSONValue> params,
               Completion completion, std::optional<std::chrono::milliseconds> timeout) {
        FUNC_SCOPE();
        const std::string id = makeId();
        const auto deadline = timeout.value_or(defaultTimeout);
        Pending p;
        p.sessionId = sessionId;
        p.method = method;
        p.issuedAt = Clock::now();
        p.timeoutAt = p.issuedAt + deadline;
        p.completion = std::move(completion);
        bool registered = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!shutdown) {
                p.timer = std::make_unique<net::steady_timer>(scheduler.Context());
                p.timer->expires_at(p.timeoutAt);
                p.timer->async_wait([weak = weak_from_this(), id](const boost::system::error_code& ec) {
                    if (ec == net::error::operation_aborted) {
                        return;
                    }
                    if (auto self = weak.lock()) {
                        self->expire(id);
                    }
                });
                pending.emplace(id, std::move(p));
                registered = true;
            }
        }
        if (!registered) {
            complete(p, std::make_exception_ptr(errors::ChannelError("Correlator is shut down")), JSONValue());
            return;
        }
        LOG_DEBUG("Outbound request {} ({}) -> {}", id, method, sessionId);

        JSONRPCRequest request(id, method, std::move(params));
        bool sent = false;
        std::string failure = "Session unavailable: " + sessionId;
        try {
            sent = send && send(sessionId, request.Serialize());
        } catch (const std::exception& e) {
            failure = std::string("Send failed: ") + e.what();
        }
        if (!sent) {
            if (auto undelivered = take(id)) {
                LOG_WARN("Outbound request {} not delivered: {}", id, failure);
                complete(*undelivered, std::make_exception_ptr(errors::ChannelError(failure)), JSONValue());
            }
        }
    }

    bool resolve(const JSONRPCResponse& response) {
        const auto* sid = std::get_if<std::string>(&response.id);
        if (!sid) {
            return false;
        }
        auto p = take(*sid);
        if (!p.has_value()) {
            LOG_DEBUG("Response for unknown or settled request {}", *sid);
            return false;
        }
        if (response.IsError()) {
            auto err = errors::mcpErrorFromResponse(response);
            if (!err.has_value()) {
                err = errors::makeError(JSONRPCErrorCodes::InternalError, "Malformed error response");
            }
            complete(*p, std::make_exception_ptr(errors::McpException(err.value())), JSONValue());
        } else {
            complete(*p, nullptr, response.result.value_or(JSONValue(nullptr)));
        }
        return true;
    }

    // Removes every entry matching pred and fails it with ChannelError.
    template <typename Pred>
    std::size_t failWhere(Pred pred, const std::string& reason) {
        std::vector<Pending> failed;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto it = pending.begin(); it != pending.end();) {
                if (pred(it->second)) {
                    if (it->second.timer) {
                        it->second.timer->cancel();
                    }
                    failed.push_back(std::move(it->second));
                    it = pending.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& p : failed) {
            complete(p, std::make_exception_ptr(errors::ChannelError(reason)), JSONValue());
        }
        return failed.size();
    }

    // Adapts issue() to an Asio completion token; the handler runs on its own associated executor.
    template <typename CompletionToken>
    static auto asyncIssue(std::shared_ptr<Impl> impl, std::string sessionId, std::string method,
                           std::optional<JSONValue> params, std::optional<std::chrono::milliseconds> timeout,
                           CompletionToken&& token) {
        return net::async_initiate<CompletionToken, void(std::exception_ptr, JSONValue)>(
            [impl, sessionId, method, params, timeout](auto handler) mutable {
                using Handler = std::decay_t<decltype(handler)>;
                auto ex = net::get_associated_executor(handler, impl->scheduler.GetExecutor());
                auto shared = std::make_shared<Handler>(std::move(handler));
                impl->issue(sessionId, method, std::move(params),
                            [ex, shared](std::exception_ptr e, JSONValue v) {
                                net::post(ex, [shared, e, v = std::move(v)]() mutable {
                                    (*shared)(e, std::move(v));
                                });
                            },
                            timeout);
            },
            token);
    }

    static net::awaitable<JSONValue> coIssueWithRetry(std::shared_ptr<Impl> impl, std::string sessionId,
                                                      std::string method, std::optional<JSONValue> params,
                                                      RetryPolicy policy,
                                                      std::optional<std::chrono::milliseconds> timeout) {
        const unsigned attempts = std::max(1u, policy.maxAttempts);
        std::exception_ptr last;
        for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
            try {
                JSONValue result = co_await asyncIssue(impl, sessionId, method, params, timeout, net::use_awaitable);
                co_return result;
            } catch (const errors::TimeoutError& e) {
                LOG_WARN("{} attempt {}/{} timed out: {}", method, attempt, attempts, e.what());
                last = std::current_exception();
            } catch (const errors::ChannelError& e) {
                LOG_WARN("{} attempt {}/{} failed on channel: {}", method, attempt, attempts, e.what());
                last = std::current_exception();
            }
            if (attempt < attempts) {
                net::steady_timer delay(co_await net::this_coro::executor);
                delay.expires_after(policy.DelayAfter(attempt));
                co_await delay.async_wait(net::use_awaitable);
            }
        }
        std::rethrow_exception(last);
    }
};

std::atomic<std::uint64_t> OutboundRequestCorrelator::Impl::nextId{0};

OutboundRequestCorrelator::OutboundRequestCorrelator(BackgroundScheduler& scheduler, SendFunction send,
                                                     std::chrono::milliseconds defaultTimeout)
    : pImpl(std::make_shared<Impl>(scheduler, std::move(send), defaultTimeout)) {}

OutboundRequestCorrelator::~OutboundRequestCorrelator() {
    Shutdown();
}

std::future<JSONValue> OutboundRequestCorrelator::Issue(const std::string& sessionId, const std::string& method,
                                                        std::optional<JSONValue> params,
                                                        std::optional<std::chrono::milliseconds> timeout) {
    auto promise = std::make_shared<std::promise<JSONValue>>();
    auto fut = promise->get_future();
    pImpl->issue(sessionId, method, std::move(params),
                 [promise](std::exception_ptr e, JSONValue v) {
                     if (e) {
                         promise->set_exception(e);
                     } else {
                         promise->set_value(std::move(v));
                     }
                 },
                 timeout);
    return fut;
}

void OutboundRequestCorrelator::IssueAsync(const std::string& sessionId, const std::string& method,
                                           std::optional<JSONValue> params, Completion completion,
                                           std::optional<std::chrono::milliseconds> timeout) {
    pImpl->issue(sessionId, method, std::move(params), std::move(completion), timeout);
}

std::future<JSONValue> OutboundRequestCorrelator::IssueWithRetry(const std::string& sessionId,
                                                                 const std::string& method,
                                                                 std::optional<JSONValue> params,
                                                                 const RetryPolicy& policy,
                                                                 std::optional<std::chrono::milliseconds> timeout) {
    return net::co_spawn(pImpl->scheduler.Context(),
                         Impl::coIssueWithRetry(pImpl, sessionId, method, std::move(params), policy, timeout),
                         net::use_future);
}

bool OutboundRequestCorrelator::Resolve(const JSONRPCResponse& response) {
    return pImpl->resolve(response);
}

std::size_t OutboundRequestCorrelator::FailSession(const std::string& sessionId) {
    std::size_t n = pImpl->failWhere([&](const Impl::Pending& p) { return p.sessionId == sessionId; },
                                     "Session closed: " + sessionId);
    if (n > 0) {
        LOG_INFO("Failed {} outbound request(s) for closed session {}", n, sessionId);
    }
    return n;
}

std::size_t OutboundRequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.size();
}

bool OutboundRequestCorrelator::IsPending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.find(id) != pImpl->pending.end();
}

void OutboundRequestCorrelator::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shutdown) {
            return;
        }
        pImpl->shutdown = true;
    }
    pImpl->failWhere([](const Impl::Pending&) { return true; }, "Server shutting down");
}

} // namespace embedmcp
