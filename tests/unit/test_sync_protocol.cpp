#include <catch2/catch_test_macros.hpp>
#include "protocol/sync_protocol.hpp"
#include "support/log_replica.hpp"

using namespace weave;
using namespace weave::protocol;
using weave::testing::LogReplica;

TEST_CASE("Step 1 is answered with exactly what the peer lacks", "[protocol][sync]") {
    LogReplica a("a");
    LogReplica b("b");
    a.set("title", "draft");
    a.set("body", "hello");
    b.set("title", "other");

    const auto step1 = make_sync_step1(b);
    REQUIRE(step1.type == SyncMessageType::Step1);

    auto reply = read_sync_frame(a, step1, crdt::UpdateOrigin::remote(7));
    REQUIRE(reply.is_ok());
    REQUIRE(reply.unwrap().has_value());
    const auto step2 = *reply.unwrap();
    REQUIRE(step2.type == SyncMessageType::Step2);

    auto applied = read_sync_frame(b, step2, crdt::UpdateOrigin::remote(7));
    REQUIRE(applied.is_ok());
    REQUIRE_FALSE(applied.unwrap().has_value());
    REQUIRE(b.opCount() == 3);
    REQUIRE(b.get("body") == "hello");
}

TEST_CASE("Applying a sync frame tags the replica update with the origin", "[protocol][sync]") {
    LogReplica a("a");
    LogReplica b("b");
    a.set("k", "v");

    std::vector<crdt::UpdateOrigin> origins;
    QObject::connect(&b, &crdt::DocumentReplica::updated,
                     [&](const Bytes&, const crdt::UpdateOrigin& origin) { origins.push_back(origin); });

    auto update = a.encodeUpdate({}).unwrap();
    REQUIRE(read_sync_frame(b, make_sync_update(update), crdt::UpdateOrigin::remote(42)).is_ok());
    REQUIRE(origins.size() == 1);
    REQUIRE(origins[0] == crdt::UpdateOrigin::remote(42));

    SECTION("re-applying the same update is a no-op") {
        REQUIRE(read_sync_frame(b, make_sync_update(update), crdt::UpdateOrigin::remote(42)).is_ok());
        REQUIRE(origins.size() == 1);
    }
}

TEST_CASE("Bad update bytes surface as an error, not a crash", "[protocol][sync]") {
    LogReplica a("a");
    auto result = read_sync_frame(a, SyncFrame{SyncMessageType::Update, Bytes{0x05, 0x01}},
                                  crdt::UpdateOrigin::remote(1));
    REQUIRE(result.is_err());
    REQUIRE(a.opCount() == 0);
}
