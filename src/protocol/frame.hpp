#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <span>
#include <variant>

namespace weave::protocol {

/**
 * Top-level message kinds. The value is the first var uint of every frame.
 */
enum class FrameKind : uint8_t {
    Sync = 0,
    Awareness = 1,
    QueryAwareness = 3
};

/**
 * Sub-types carried inside a Sync frame.
 */
enum class SyncMessageType : uint8_t {
    Step1 = 0,   // sender's state vector
    Step2 = 1,   // update that brings the receiver up to date
    Update = 2   // unsolicited incremental update
};

/**
 * Wire format:
 *   Sync            [0][sub-type][var bytes]
 *   Awareness       [1][var bytes: encoded presence update]
 *   QueryAwareness  [3]
 */
struct SyncFrame {
    SyncMessageType type = SyncMessageType::Update;
    Bytes data;

    bool operator==(const SyncFrame&) const = default;
};

struct AwarenessFrame {
    Bytes update;

    bool operator==(const AwarenessFrame&) const = default;
};

struct QueryAwarenessFrame {
    bool operator==(const QueryAwarenessFrame&) const = default;
};

using Frame = std::variant<SyncFrame, AwarenessFrame, QueryAwarenessFrame>;

/**
 * Encode one frame. A frame always carries exactly one kind and one payload.
 */
[[nodiscard]] Bytes encode_frame(const Frame& frame);

/**
 * Decode one frame. Unknown kinds, unknown sync sub-types and truncated
 * payloads fail with ErrorCode::ProtocolDecode. Trailing bytes are ignored.
 */
[[nodiscard]] Result<Frame, Error> decode_frame(std::span<const uint8_t> data);

[[nodiscard]] const char* frame_name(const Frame& frame);

} // namespace weave::protocol
