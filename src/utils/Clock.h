// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_CLOCK_H
#define CERTENVAULT_CLOCK_H

#include <atomic>
#include <chrono>
#include <cstdint>

namespace CertenVault {

/**
 * @brief Wall-clock source in milliseconds since the Unix epoch
 *
 * Injected into Vault and SignRequestQueue so session timeouts and request
 * ages can be tested without sleeping.
 */
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual int64_t now_ms() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/// Clock that only moves when told to
class ManualClock final : public IClock {
public:
    explicit ManualClock(int64_t start_ms = 1'700'000'000'000) : m_now(start_ms) {}

    [[nodiscard]] int64_t now_ms() const override { return m_now.load(); }

    void advance_ms(int64_t delta) { m_now += delta; }
    void advance(std::chrono::milliseconds delta) { m_now += delta.count(); }
    void set(int64_t now) { m_now = now; }

private:
    std::atomic<int64_t> m_now;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_CLOCK_H
