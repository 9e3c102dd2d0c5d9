#include <catch2/catch_test_macros.hpp>
#include "network/reconnect_policy.hpp"

#include <vector>

using namespace weave::network;

TEST_CASE("Reconnect delays double from the base up to the cap", "[network][reconnect]") {
    const ReconnectPolicy policy;
    REQUIRE(policy.delayFor(0) == 2000);
    REQUIRE(policy.delayFor(1) == 4000);
    REQUIRE(policy.delayFor(2) == 8000);
    REQUIRE(policy.delayFor(3) == 16000);
    REQUIRE(policy.delayFor(4) == 30000);
    REQUIRE(policy.delayFor(40) == 30000);
}

TEST_CASE("The failure budget is spent after maxAttempts", "[network][reconnect]") {
    const ReconnectPolicy policy;
    auto state = policy.initialState();
    REQUIRE(state.attempts == 0);
    REQUIRE(state.maxAttempts == 5);

    std::vector<int64_t> delays;
    while (policy.recordFailure(state)) {
        delays.push_back(state.nextDelayMs);
    }
    REQUIRE(delays == std::vector<int64_t>{2000, 4000, 8000, 16000, 30000});
    REQUIRE(state.attempts == 5);
    REQUIRE(state.nextDelayMs == 0);

    policy.reset(state);
    REQUIRE(state == policy.initialState());
    REQUIRE(policy.recordFailure(state));
    REQUIRE(state.nextDelayMs == 2000);
}

TEST_CASE("Policy parameters are sanitised", "[network][reconnect]") {
    const ReconnectPolicy policy(0, -5, 0);
    REQUIRE(policy.baseMs() == 1);
    REQUIRE(policy.capMs() == 1);
    REQUIRE(policy.maxAttempts() == 1);

    const ReconnectPolicy custom(100, 250, 3);
    REQUIRE(custom.delayFor(0) == 100);
    REQUIRE(custom.delayFor(1) == 200);
    REQUIRE(custom.delayFor(2) == 250);
}
