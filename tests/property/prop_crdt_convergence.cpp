#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "presence/presence_table.hpp"
#include "protocol/sync_protocol.hpp"
#include "support/log_replica.hpp"

#include <algorithm>
#include <memory>

using namespace weave;
using weave::crdt::UpdateOrigin;
using weave::testing::LogReplica;

namespace {

constexpr size_t REPLICAS = 3;

struct Action {
    enum class Kind { Edit, Pull } kind = Kind::Edit;
    size_t replica = 0;
    size_t peer = 0;
    std::string key;
    std::string value;
};

// Bring `to` up to date with `from` the way a transport does: step 1 from
// `to`, step 2 back from `from`.
void pull(LogReplica& to, LogReplica& from) {
    const auto step1 = protocol::make_sync_step1(to);
    auto reply = protocol::read_sync_frame(from, step1, UpdateOrigin::remote(1));
    RC_ASSERT(reply.is_ok());
    RC_ASSERT(reply.unwrap().has_value());
    RC_ASSERT(protocol::read_sync_frame(to, *reply.unwrap(), UpdateOrigin::remote(2)).is_ok());
}

} // namespace

namespace rc {

template<>
struct Arbitrary<Action> {
    static Gen<Action> arbitrary() {
        const auto index = gen::inRange<size_t>(0, REPLICAS);
        return gen::oneOf(
            gen::map(gen::tuple(index, gen::element(std::string("title"), std::string("body"), std::string("tags")),
                                gen::arbitrary<std::string>()),
                [](const std::tuple<size_t, std::string, std::string>& t) {
                    return Action{Action::Kind::Edit, std::get<0>(t), 0, std::get<1>(t), std::get<2>(t)};
                }),
            gen::map(gen::pair(index, index),
                [](const std::pair<size_t, size_t>& p) {
                    return Action{Action::Kind::Pull, p.first, p.second, {}, {}};
                })
        );
    }
};

} // namespace rc

TEST_CASE("Property: replicas converge after a full exchange", "[property][sync]") {
    REQUIRE(rc::check("any interleaving of edits and pulls converges",
        [](const std::vector<Action>& actions) {
            std::vector<std::unique_ptr<LogReplica>> replicas;
            for (size_t i = 0; i < REPLICAS; ++i) {
                replicas.push_back(std::make_unique<LogReplica>("r" + std::to_string(i)));
            }

            size_t edits = 0;
            for (const auto& action : actions) {
                if (action.kind == Action::Kind::Edit) {
                    replicas[action.replica]->set(action.key, action.value);
                    ++edits;
                } else if (action.replica != action.peer) {
                    pull(*replicas[action.replica], *replicas[action.peer]);
                }
            }

            // Two rounds over every ordered pair reach everyone.
            for (int round = 0; round < 2; ++round) {
                for (size_t i = 0; i < REPLICAS; ++i) {
                    for (size_t j = 0; j < REPLICAS; ++j) {
                        if (i != j) pull(*replicas[i], *replicas[j]);
                    }
                }
            }

            for (const auto& replica : replicas) {
                RC_ASSERT(replica->opCount() == edits);
                RC_ASSERT(replica->snapshot() == replicas.front()->snapshot());
            }
        }));
}

TEST_CASE("Property: update delivery order and duplicates do not matter", "[property][sync]") {
    REQUIRE(rc::check("shuffled and repeated updates converge",
        [](const std::vector<std::pair<bool, std::string>>& edits) {
            LogReplica source("source");
            std::vector<Bytes> updates;
            QObject::connect(&source, &crdt::DocumentReplica::updated,
                             [&](const Bytes& update, const UpdateOrigin&) { updates.push_back(update); });
            for (const auto& [title, value] : edits) {
                source.set(title ? "title" : "body", value);
            }

            auto delivered = updates;
            delivered.insert(delivered.end(), updates.begin(), updates.end());
            const auto order = *rc::gen::container<std::vector<size_t>>(
                delivered.size(), rc::gen::inRange<size_t>(0, std::max<size_t>(1, delivered.size())));

            LogReplica sink("sink");
            for (size_t i : order) {
                RC_ASSERT(sink.applyUpdate(delivered[i % delivered.size()], UpdateOrigin::remote(3)).is_ok());
            }
            for (const auto& update : updates) {
                RC_ASSERT(sink.applyUpdate(update, UpdateOrigin::remote(3)).is_ok());
            }
            RC_ASSERT(sink.snapshot() == source.snapshot());
        }));
}

TEST_CASE("Property: presence tables agree whatever the delivery order", "[property][presence]") {
    REQUIRE(rc::check("last writer wins per client",
        [](const std::vector<std::pair<bool, int>>& writes) {
            presence::PresenceTable a(1);
            presence::PresenceTable b(2);
            std::vector<Bytes> from_a;
            std::vector<Bytes> from_b;
            QObject::connect(&a, &presence::PresenceTable::updated,
                             [&](const presence::PresenceChange& change, const UpdateOrigin& origin) {
                                 if (origin == UpdateOrigin::local()) from_a.push_back(a.encodeUpdate(change.all()));
                             });
            QObject::connect(&b, &presence::PresenceTable::updated,
                             [&](const presence::PresenceChange& change, const UpdateOrigin& origin) {
                                 if (origin == UpdateOrigin::local()) from_b.push_back(b.encodeUpdate(change.all()));
                             });
            for (const auto& [on_a, n] : writes) {
                (on_a ? a : b).setLocalField(QStringLiteral("n"), n);
            }

            // Observer sees each stream reversed; the newest write still wins.
            presence::PresenceTable observer(3);
            for (auto it = from_a.rbegin(); it != from_a.rend(); ++it) {
                RC_ASSERT(observer.applyUpdate(*it, UpdateOrigin::remote(1)).is_ok());
            }
            for (auto it = from_b.rbegin(); it != from_b.rend(); ++it) {
                RC_ASSERT(observer.applyUpdate(*it, UpdateOrigin::remote(2)).is_ok());
            }
            if (!from_a.empty()) {
                RC_ASSERT(observer.states().at(1) == *a.localState());
            }
            if (!from_b.empty()) {
                RC_ASSERT(observer.states().at(2) == *b.localState());
            }
        }));
}
