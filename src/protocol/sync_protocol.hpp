#pragma once

#include "crdt/document_replica.hpp"
#include "protocol/frame.hpp"

#include <optional>

namespace weave::protocol {

/**
 * Step 1: announce our state vector so the peer can compute what we miss.
 */
[[nodiscard]] SyncFrame make_sync_step1(const crdt::DocumentReplica& replica);

/**
 * Step 2: everything we have that the peer (described by its state vector) lacks.
 */
[[nodiscard]] Result<SyncFrame, Error> make_sync_step2(const crdt::DocumentReplica& replica,
                                                       const Bytes& remote_state_vector);

[[nodiscard]] SyncFrame make_sync_update(const Bytes& update);

/**
 * Handle an inbound Sync frame against a replica.
 *
 * Step 1 produces a Step 2 reply. Step 2 and Update are applied with the
 * given origin and produce no reply. Errors come from the replica (bad update
 * bytes or a malformed state vector).
 */
[[nodiscard]] Result<std::optional<SyncFrame>, Error> read_sync_frame(
    crdt::DocumentReplica& replica,
    const SyncFrame& frame,
    const crdt::UpdateOrigin& origin);

} // namespace weave::protocol
