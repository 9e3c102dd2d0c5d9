#pragma once

#include <cstdint>

namespace weave::network {

/**
 * ReconnectState - consecutive failure bookkeeping of one transport.
 *
 * nextDelayMs is the wait before the next attempt:
 *   min(base * 2^attempts, cap)
 * where attempts counts failures since the last successful connection.
 */
struct ReconnectState {
    int attempts = 0;
    int maxAttempts = 5;
    int64_t nextDelayMs = 0;

    bool operator==(const ReconnectState&) const = default;
};

class ReconnectPolicy {
public:
    static constexpr int64_t DEFAULT_BASE_MS = 2000;
    static constexpr int64_t DEFAULT_CAP_MS = 30000;
    static constexpr int DEFAULT_MAX_ATTEMPTS = 5;

    ReconnectPolicy() = default;
    ReconnectPolicy(int64_t base_ms, int64_t cap_ms, int max_attempts);

    [[nodiscard]] int64_t baseMs() const { return base_ms_; }
    [[nodiscard]] int64_t capMs() const { return cap_ms_; }
    [[nodiscard]] int maxAttempts() const { return max_attempts_; }

    /**
     * Delay before retry number `attempts` (0-based).
     */
    [[nodiscard]] int64_t delayFor(int attempts) const;

    [[nodiscard]] ReconnectState initialState() const;

    /**
     * Record a failure. Returns false when the budget is spent; the state is
     * then left at attempts == maxAttempts with no delay.
     */
    [[nodiscard]] bool recordFailure(ReconnectState& state) const;

    void reset(ReconnectState& state) const;

private:
    int64_t base_ms_ = DEFAULT_BASE_MS;
    int64_t cap_ms_ = DEFAULT_CAP_MS;
    int max_attempts_ = DEFAULT_MAX_ATTEMPTS;
};

} // namespace weave::network
