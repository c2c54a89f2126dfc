// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "SignRequestQueue.h"
#include "../crypto/VaultCrypto.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <memory>

namespace CertenVault {

namespace {

SignOutcome rejection(VaultError code, std::string_view message) {
    SignOutcome outcome;
    outcome.status = code == VaultError::UserRejected || code == VaultError::Timeout
        ? SignRequestStatus::Rejected
        : SignRequestStatus::Error;
    outcome.error = code;
    outcome.message = std::string(message);
    return outcome;
}

}  // namespace

SignRequestQueue::SignRequestQueue(const IClock& clock, std::chrono::milliseconds grace_period)
    : m_clock(clock)
    , m_grace_period(grace_period) {
}

std::vector<SignRequest>::iterator SignRequestQueue::find_locked(std::string_view id) {
    return std::ranges::find(m_requests, id, &SignRequest::id);
}

void SignRequestQueue::purge_locked() {
    const int64_t now = m_clock.now_ms();
    const int64_t grace = m_grace_period.count();
    std::erase_if(m_requests, [&](const SignRequest& request) {
        if (!is_terminal(request.status) || !request.finished_at) {
            return false;
        }
        if (now - *request.finished_at < grace) {
            return false;
        }
        m_callbacks.erase(request.id);
        return true;
    });
}

// ============================================================================
// Enqueue
// ============================================================================

std::string SignRequestQueue::enqueue(
    SignRequestData data,
    std::string_view origin,
    CompletionCallback callback) {

    SignRequest request;
    request.id = VaultCrypto::generate_uuid();
    request.method = std::string(method_for(data));
    request.origin = std::string(origin);
    request.data = std::move(data);
    request.status = SignRequestStatus::Pending;

    {
        std::lock_guard lock(m_mutex);
        purge_locked();
        request.timestamp = m_clock.now_ms();
        m_requests.push_back(request);
        if (callback) {
            m_callbacks.insert_or_assign(request.id, std::move(callback));
        }
    }

    Log::info("Sign request {} queued: {} from {}", request.id, request.method, request.origin);
    m_signal_request_added.emit(request);
    return request.id;
}

std::string SignRequestQueue::add(SignRequestData data, std::string_view origin) {
    return enqueue(std::move(data), origin, {});
}

SignRequestQueue::Submission SignRequestQueue::submit(SignRequestData data, std::string_view origin) {
    auto promise = std::make_shared<std::promise<SignOutcome>>();
    Submission submission;
    submission.outcome = promise->get_future();
    submission.id = enqueue(std::move(data), origin, [promise](const SignOutcome& outcome) {
        promise->set_value(outcome);
    });
    return submission;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<SignRequest> SignRequestQueue::get(std::string_view id) {
    std::lock_guard lock(m_mutex);
    purge_locked();
    auto it = find_locked(id);
    if (it == m_requests.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<SignRequest> SignRequestQueue::get_next() {
    auto pending = get_pending();
    if (pending.empty()) {
        return std::nullopt;
    }
    return std::move(pending.front());
}

std::vector<SignRequest> SignRequestQueue::get_pending() {
    std::lock_guard lock(m_mutex);
    purge_locked();
    std::vector<SignRequest> pending;
    for (const auto& request : m_requests) {
        if (request.status == SignRequestStatus::Pending) {
            pending.push_back(request);
        }
    }
    std::ranges::stable_sort(pending, {}, &SignRequest::timestamp);
    return pending;
}

size_t SignRequestQueue::pending_count() {
    std::lock_guard lock(m_mutex);
    purge_locked();
    return static_cast<size_t>(std::ranges::count(m_requests, SignRequestStatus::Pending, &SignRequest::status));
}

// ============================================================================
// Transitions
// ============================================================================

VaultResult<> SignRequestQueue::on_complete(std::string_view id, CompletionCallback callback) {
    std::lock_guard lock(m_mutex);
    auto it = find_locked(id);
    if (it == m_requests.end()) {
        return std::unexpected(VaultError::RequestNotFound);
    }
    if (is_terminal(it->status)) {
        return std::unexpected(VaultError::RequestNotPending);
    }
    m_callbacks.insert_or_assign(std::string(id), std::move(callback));
    return {};
}

VaultResult<> SignRequestQueue::update_status(std::string_view id, SignRequestStatus status) {
    if (is_terminal(status)) {
        return std::unexpected(VaultError::InvalidData);
    }
    std::lock_guard lock(m_mutex);
    auto it = find_locked(id);
    if (it == m_requests.end()) {
        return std::unexpected(VaultError::RequestNotFound);
    }
    if (is_terminal(it->status)) {
        return std::unexpected(VaultError::RequestNotPending);
    }
    it->status = status;
    return {};
}

VaultResult<SignRequestQueue::Finished> SignRequestQueue::finish_locked(
    std::string_view id,
    SignOutcome outcome) {

    auto it = find_locked(id);
    if (it == m_requests.end()) {
        return std::unexpected(VaultError::RequestNotFound);
    }
    if (is_terminal(it->status)) {
        return std::unexpected(VaultError::RequestNotPending);
    }

    it->status = outcome.status;
    it->finished_at = m_clock.now_ms();

    Finished finished;
    finished.outcome = std::move(outcome);
    auto callback = m_callbacks.find(id);
    if (callback != m_callbacks.end()) {
        finished.callback = std::move(callback->second);
        m_callbacks.erase(callback);
    }
    return finished;
}

VaultResult<> SignRequestQueue::finish(std::string_view id, SignOutcome outcome) {
    VaultResult<Finished> finished;
    {
        std::lock_guard lock(m_mutex);
        finished = finish_locked(id, std::move(outcome));
    }
    if (!finished) {
        Log::debug("Sign request {} not finished: {}", id, to_string(finished.error()));
        return std::unexpected(finished.error());
    }

    Log::info("Sign request {} {}", id, to_string(finished->outcome.status));
    if (finished->callback) {
        finished->callback(finished->outcome);
    }
    return {};
}

VaultResult<> SignRequestQueue::complete(std::string_view id, SignedPayload result) {
    SignOutcome outcome;
    outcome.status = SignRequestStatus::Completed;
    outcome.result = std::move(result);
    return finish(id, std::move(outcome));
}

VaultResult<> SignRequestQueue::reject(std::string_view id, std::string_view reason) {
    return finish(id, rejection(VaultError::UserRejected, reason));
}

VaultResult<> SignRequestQueue::error(std::string_view id, std::string_view message, VaultError code) {
    auto outcome = rejection(code, message);
    outcome.status = SignRequestStatus::Error;
    return finish(id, std::move(outcome));
}

// ============================================================================
// Sweeps
// ============================================================================

size_t SignRequestQueue::cleanup(std::chrono::milliseconds timeout) {
    std::vector<Finished> expired;
    {
        std::lock_guard lock(m_mutex);
        purge_locked();

        const int64_t now = m_clock.now_ms();
        std::vector<std::string> stale;
        for (const auto& request : m_requests) {
            if (now - request.timestamp > timeout.count()) {
                stale.push_back(request.id);
            }
        }

        for (const auto& id : stale) {
            auto it = find_locked(id);
            if (is_terminal(it->status)) {
                m_callbacks.erase(id);
                m_requests.erase(it);
                continue;
            }
            auto finished = finish_locked(id, rejection(VaultError::Timeout, TIMEOUT_REASON));
            if (finished) {
                expired.push_back(std::move(*finished));
            }
        }
    }

    if (!expired.empty()) {
        Log::info("Timed out {} sign request(s)", expired.size());
    }
    for (auto& finished : expired) {
        if (finished.callback) {
            finished.callback(finished.outcome);
        }
    }
    return expired.size();
}

void SignRequestQueue::remove(std::string_view id) {
    std::optional<Finished> removed;
    {
        std::lock_guard lock(m_mutex);
        auto it = find_locked(id);
        if (it == m_requests.end()) {
            return;
        }
        // An open request still owes its submitter an outcome
        if (!is_terminal(it->status)) {
            auto finished = finish_locked(id, rejection(VaultError::UserRejected, REMOVED_REASON));
            if (finished) {
                removed = std::move(*finished);
            }
            it = find_locked(id);
        }
        m_requests.erase(it);
        m_callbacks.erase(std::string(id));
    }

    if (removed) {
        Log::info("Sign request {} removed while open", id);
        if (removed->callback) {
            removed->callback(removed->outcome);
        }
    }
}

void SignRequestQueue::clear() {
    std::vector<Finished> cleared;
    {
        std::lock_guard lock(m_mutex);
        std::vector<std::string> open;
        for (const auto& request : m_requests) {
            if (!is_terminal(request.status)) {
                open.push_back(request.id);
            }
        }
        for (const auto& id : open) {
            auto finished = finish_locked(id, rejection(VaultError::UserRejected, CLEARED_REASON));
            if (finished) {
                cleared.push_back(std::move(*finished));
            }
        }
        m_requests.clear();
        m_callbacks.clear();
    }

    if (!cleared.empty()) {
        Log::info("Sign queue cleared, {} pending request(s) rejected", cleared.size());
    }
    for (auto& finished : cleared) {
        if (finished.callback) {
            finished.callback(finished.outcome);
        }
    }
}

void SignRequestQueue::set_grace_period(std::chrono::milliseconds grace_period) {
    std::lock_guard lock(m_mutex);
    m_grace_period = grace_period;
}

}  // namespace CertenVault
