#include "network/reconnect_policy.hpp"

#include <algorithm>

namespace weave::network {

ReconnectPolicy::ReconnectPolicy(int64_t base_ms, int64_t cap_ms, int max_attempts)
    : base_ms_(std::max<int64_t>(1, base_ms))
    , cap_ms_(std::max(base_ms_, cap_ms))
    , max_attempts_(std::max(1, max_attempts))
{
}

int64_t ReconnectPolicy::delayFor(int attempts) const {
    int64_t delay = base_ms_;
    for (int i = 0; i < attempts && delay < cap_ms_; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap_ms_);
}

ReconnectState ReconnectPolicy::initialState() const {
    return ReconnectState{.attempts = 0, .maxAttempts = max_attempts_, .nextDelayMs = base_ms_};
}

bool ReconnectPolicy::recordFailure(ReconnectState& state) const {
    state.maxAttempts = max_attempts_;
    if (state.attempts >= max_attempts_) {
        state.nextDelayMs = 0;
        return false;
    }
    state.nextDelayMs = delayFor(state.attempts);
    state.attempts += 1;
    return true;
}

void ReconnectPolicy::reset(ReconnectState& state) const {
    state = initialState();
}

} // namespace weave::network
