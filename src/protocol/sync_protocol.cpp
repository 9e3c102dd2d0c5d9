#include "protocol/sync_protocol.hpp"

namespace weave::protocol {

using Reply = Result<std::optional<SyncFrame>, Error>;

SyncFrame make_sync_step1(const crdt::DocumentReplica& replica) {
    return SyncFrame{.type = SyncMessageType::Step1, .data = replica.stateVector()};
}

Result<SyncFrame, Error> make_sync_step2(const crdt::DocumentReplica& replica,
                                         const Bytes& remote_state_vector) {
    return replica.encodeUpdate(remote_state_vector).map([](Bytes update) {
        return SyncFrame{.type = SyncMessageType::Step2, .data = std::move(update)};
    });
}

SyncFrame make_sync_update(const Bytes& update) {
    return SyncFrame{.type = SyncMessageType::Update, .data = update};
}

Reply read_sync_frame(crdt::DocumentReplica& replica,
                      const SyncFrame& frame,
                      const crdt::UpdateOrigin& origin) {
    switch (frame.type) {
        case SyncMessageType::Step1: {
            auto step2 = make_sync_step2(replica, frame.data);
            if (step2.is_err()) {
                return Reply::err(step2.unwrap_err());
            }
            return Reply::ok(std::move(step2).unwrap());
        }
        case SyncMessageType::Step2:
        case SyncMessageType::Update: {
            auto applied = replica.applyUpdate(frame.data, origin);
            if (applied.is_err()) {
                return Reply::err(applied.unwrap_err());
            }
            return Reply::ok(std::nullopt);
        }
    }
    return Reply::err(Error{"Unknown sync message type", ErrorCode::ProtocolDecode});
}

} // namespace weave::protocol
