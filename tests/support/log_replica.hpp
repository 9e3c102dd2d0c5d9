#pragma once

#include "crdt/document_replica.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace weave::testing {

/**
 * LogReplica - a tiny grow-only op log used to exercise the sync paths
 * without a real CRDT library.
 *
 * Each op is (actor, seq, key, value). The value of a key is the op with
 * the highest (seq, actor). State vector: per actor, the longest prefix of
 * sequence numbers held without a gap.
 */
class LogReplica : public crdt::DocumentReplica {
    Q_OBJECT

public:
    struct Op {
        std::string actor;
        uint64_t seq = 0;
        std::string key;
        std::string value;

        auto operator<=>(const Op& other) const {
            return std::tie(actor, seq) <=> std::tie(other.actor, other.seq);
        }
        bool operator==(const Op& other) const {
            return actor == other.actor && seq == other.seq;
        }
    };

    explicit LogReplica(std::string actor, QObject* parent = nullptr);

    void set(const std::string& key, const std::string& value);
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    [[nodiscard]] std::map<std::string, std::string> snapshot() const;
    [[nodiscard]] size_t opCount() const { return ops_.size(); }

    Result<void, Error> applyUpdate(const Bytes& update, const crdt::UpdateOrigin& origin) override;
    [[nodiscard]] Result<Bytes, Error> encodeUpdate(const Bytes& remote_state_vector) const override;
    [[nodiscard]] Bytes stateVector() const override;

    static Bytes encodeOps(const std::vector<Op>& ops);

private:
    std::string actor_;
    uint64_t next_seq_ = 1;
    std::set<Op> ops_;
};

} // namespace weave::testing
