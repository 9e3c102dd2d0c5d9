#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "network/reconnect_policy.hpp"
#include "protocol/frame.hpp"
#include "protocol/varint.hpp"

using namespace weave;
using namespace weave::protocol;

TEST_CASE("Property: var uint encoding", "[property][wire]") {
    REQUIRE(rc::check("decodes to the written value and uses the minimal length",
        [](uint64_t value) {
            Encoder enc;
            enc.write_var_uint(value);
            const auto bytes = enc.take();

            size_t expected = 1;
            for (uint64_t v = value >> 7; v != 0; v >>= 7) ++expected;
            RC_ASSERT(bytes.size() == expected);
            RC_ASSERT((bytes.back() & 0x80) == 0);

            Decoder dec(bytes);
            RC_ASSERT(dec.read_var_uint().unwrap() == value);
            RC_ASSERT(dec.at_end());
        }));
}

TEST_CASE("Property: frame decoding never crashes on garbage", "[property][wire]") {
    REQUIRE(rc::check("arbitrary bytes either decode or fail cleanly",
        [](const std::vector<uint8_t>& garbage) {
            const auto decoded = decode_frame(garbage);
            if (decoded.is_err()) {
                RC_ASSERT(decoded.unwrap_err().is(ErrorCode::ProtocolDecode));
            }
        }));
}

TEST_CASE("Property: reconnect delays grow monotonically up to the cap", "[property][reconnect]") {
    REQUIRE(rc::check("delayFor is monotonic and bounded",
        [] {
            const auto base = *rc::gen::inRange<int64_t>(1, 10000);
            const auto cap = *rc::gen::inRange<int64_t>(1, 100000);
            const network::ReconnectPolicy policy(base, cap, 5);

            int64_t previous = 0;
            for (int attempts = 0; attempts < 64; ++attempts) {
                const auto delay = policy.delayFor(attempts);
                RC_ASSERT(delay >= previous);
                RC_ASSERT(delay <= policy.capMs());
                RC_ASSERT(delay >= std::min(base, policy.capMs()));
                previous = delay;
            }
            RC_ASSERT(policy.delayFor(63) == policy.capMs());
        }));
}
