// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_SIGN_REQUEST_QUEUE_H
#define CERTENVAULT_SIGN_REQUEST_QUEUE_H

#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sigc++/sigc++.h>
#include "SignRequest.h"
#include "../VaultError.h"
#include "../../utils/Clock.h"

namespace CertenVault {

/**
 * @brief Rendezvous between sign RPCs and the approval decision
 *
 * Requests enter as Pending and leave through exactly one of complete(),
 * reject() or error(). The registered completion callback is invoked at
 * most once, outside the queue's mutex, so it may call back into the queue
 * or into the Vault.
 *
 * Finished requests stay readable through get() for the grace period and
 * are purged on the next call after it has elapsed. The queue owns no
 * timer; cleanup() must be driven externally (see SessionScheduler).
 *
 * @code
 * auto submission = queue.submit(EthereumHash{hash, address}, "https://app.example");
 * // approval side: queue.get_next(), then complete() or reject()
 * SignOutcome outcome = submission.outcome.get();
 * @endcode
 */
class SignRequestQueue {
public:
    static constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{5000};
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{300000};

    static constexpr std::string_view TIMEOUT_REASON = "Request timeout";
    static constexpr std::string_view CLEARED_REASON = "Queue cleared";
    static constexpr std::string_view REMOVED_REASON = "Request removed";

    struct Submission {
        std::string id;
        std::future<SignOutcome> outcome;
    };

    explicit SignRequestQueue(const IClock& clock,
                              std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD);

    SignRequestQueue(const SignRequestQueue&) = delete;
    SignRequestQueue& operator=(const SignRequestQueue&) = delete;

    /// Enqueue a Pending request; the method name is taken from the data kind
    std::string add(SignRequestData data, std::string_view origin);

    /// add() plus a future fulfilled by the terminal transition
    [[nodiscard]] Submission submit(SignRequestData data, std::string_view origin);

    [[nodiscard]] std::optional<SignRequest> get(std::string_view id);

    /// Oldest Pending request
    [[nodiscard]] std::optional<SignRequest> get_next();

    /// Pending requests, oldest first
    [[nodiscard]] std::vector<SignRequest> get_pending();
    [[nodiscard]] size_t pending_count();

    /**
     * @brief Register the one-shot completion callback, replacing any earlier one
     * @return VaultError::RequestNotFound, or VaultError::RequestNotPending
     *         if the request has already finished
     */
    [[nodiscard]] VaultResult<> on_complete(std::string_view id, CompletionCallback callback);

    /// Pending or Approved only; terminal states go through complete/reject/error
    [[nodiscard]] VaultResult<> update_status(std::string_view id, SignRequestStatus status);

    /**
     * @return VaultError::RequestNotFound, or VaultError::RequestNotPending
     *         when the request already reached a terminal state
     */
    [[nodiscard]] VaultResult<> complete(std::string_view id, SignedPayload result);
    [[nodiscard]] VaultResult<> reject(std::string_view id, std::string_view reason);
    [[nodiscard]] VaultResult<> error(std::string_view id, std::string_view message,
                                      VaultError code = VaultError::SigningFailed);

    /**
     * @brief Expire requests older than @p timeout
     *
     * Pending requests are rejected with VaultError::Timeout, firing their
     * callbacks. Finished ones are dropped.
     *
     * @return Number of requests that were timed out
     */
    size_t cleanup(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    /**
     * @brief Drop a request immediately
     *
     * A request that is still open is first rejected with REMOVED_REASON,
     * so its callback (and any submit() future) receives an outcome.
     * Finished requests are dropped without further notification.
     */
    void remove(std::string_view id);

    /// Reject every pending request, then drop everything
    void clear();

    void set_grace_period(std::chrono::milliseconds grace_period);

    [[nodiscard]] sigc::signal<void(const SignRequest&)>& signal_request_added() {
        return m_signal_request_added;
    }

private:
    struct Finished {
        CompletionCallback callback;
        SignOutcome outcome;
    };

    std::string enqueue(SignRequestData data, std::string_view origin, CompletionCallback callback);
    [[nodiscard]] VaultResult<> finish(std::string_view id, SignOutcome outcome);
    [[nodiscard]] VaultResult<Finished> finish_locked(std::string_view id, SignOutcome outcome);
    [[nodiscard]] std::vector<SignRequest>::iterator find_locked(std::string_view id);
    void purge_locked();

    const IClock& m_clock;
    std::chrono::milliseconds m_grace_period;

    std::mutex m_mutex;
    std::vector<SignRequest> m_requests;  ///< Insertion order
    std::map<std::string, CompletionCallback, std::less<>> m_callbacks;

    sigc::signal<void(const SignRequest&)> m_signal_request_added;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_SIGN_REQUEST_QUEUE_H
