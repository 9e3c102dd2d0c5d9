#pragma once

#include "crdt/document_replica.hpp"

#include <automerge-cpp/automerge.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace weave::crdt {

/**
 * AutomergeReplica - DocumentReplica backed by an automerge_cpp::Document.
 *
 * State vector: var-uint count followed by the 32-byte change hashes of the
 * document heads. Updates are saved documents; applying one loads and merges
 * it. automerge-cpp exposes no incremental change encoding, so an update
 * carries the sender's whole history. encodeUpdate() returns an empty update
 * when the peer's heads already include all of ours.
 */
class AutomergeReplica : public DocumentReplica {
    Q_OBJECT

public:
    explicit AutomergeReplica(QObject* parent = nullptr);
    ~AutomergeReplica() override;

    Result<void, Error> applyUpdate(const Bytes& update, const UpdateOrigin& origin) override;
    [[nodiscard]] Result<Bytes, Error> encodeUpdate(const Bytes& remote_state_vector) const override;
    [[nodiscard]] Bytes stateVector() const override;

    /**
     * Run a local transaction; emits updated(..., Local) if it changed anything.
     */
    void transact(const std::function<void(automerge_cpp::Transaction&)>& fn);

    /**
     * Root-map string helpers used by the CLI and tests.
     */
    void setText(const std::string& key, const std::string& value);
    [[nodiscard]] std::optional<std::string> text(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] const automerge_cpp::Document& document() const { return doc_; }

private:
    automerge_cpp::Document doc_;
};

/**
 * Heads <-> state vector encoding, exposed for tests.
 */
[[nodiscard]] Bytes encode_heads(const std::vector<automerge_cpp::ChangeHash>& heads);
[[nodiscard]] Result<std::vector<automerge_cpp::ChangeHash>, Error> decode_heads(const Bytes& state_vector);

} // namespace weave::crdt
