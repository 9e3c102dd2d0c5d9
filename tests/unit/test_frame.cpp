#include <catch2/catch_test_macros.hpp>
#include "protocol/frame.hpp"

using namespace weave;
using namespace weave::protocol;

TEST_CASE("Frames carry the kind as the first var uint", "[protocol][frame]") {
    SECTION("sync step 1") {
        const auto bytes = encode_frame(SyncFrame{SyncMessageType::Step1, Bytes{0xAA, 0xBB}});
        REQUIRE(bytes == Bytes{0x00, 0x00, 0x02, 0xAA, 0xBB});
    }

    SECTION("sync update") {
        const auto bytes = encode_frame(SyncFrame{SyncMessageType::Update, Bytes{0x01}});
        REQUIRE(bytes == Bytes{0x00, 0x02, 0x01, 0x01});
    }

    SECTION("awareness") {
        const auto bytes = encode_frame(AwarenessFrame{Bytes{0x07, 0x08, 0x09}});
        REQUIRE(bytes == Bytes{0x01, 0x03, 0x07, 0x08, 0x09});
    }

    SECTION("query awareness has no payload") {
        REQUIRE(encode_frame(QueryAwarenessFrame{}) == Bytes{0x03});
    }
}

TEST_CASE("decode_frame restores every frame kind", "[protocol][frame]") {
    const Frame frames[] = {
        SyncFrame{SyncMessageType::Step2, Bytes{1, 2, 3}},
        AwarenessFrame{Bytes{4, 5}},
        QueryAwarenessFrame{},
    };
    for (const auto& frame : frames) {
        auto decoded = decode_frame(encode_frame(frame));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == frame);
    }
}

TEST_CASE("decode_frame rejects malformed input", "[protocol][frame]") {
    auto expect_decode_error = [](const Bytes& bytes) {
        auto decoded = decode_frame(bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().is(ErrorCode::ProtocolDecode));
    };

    SECTION("empty frame") { expect_decode_error(Bytes{}); }
    SECTION("unknown kind") { expect_decode_error(Bytes{0x02}); }
    SECTION("unknown sync sub-type") { expect_decode_error(Bytes{0x00, 0x05, 0x00}); }
    SECTION("truncated sync payload") { expect_decode_error(Bytes{0x00, 0x01, 0x04, 0x01}); }
    SECTION("truncated awareness payload") { expect_decode_error(Bytes{0x01, 0x02, 0x01}); }
}

TEST_CASE("frame_name describes the frame for logs", "[protocol][frame]") {
    REQUIRE(std::string(frame_name(SyncFrame{SyncMessageType::Step1, {}})) == "sync-step1");
    REQUIRE(std::string(frame_name(AwarenessFrame{})) == "awareness");
    REQUIRE(std::string(frame_name(QueryAwarenessFrame{})) == "query-awareness");
}
