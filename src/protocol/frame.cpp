#include "protocol/frame.hpp"
#include "protocol/varint.hpp"

namespace weave::protocol {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Result<Frame, Error> decode_error(const std::string& message) {
    return Result<Frame, Error>::err(Error{message, ErrorCode::ProtocolDecode});
}

} // namespace

Bytes encode_frame(const Frame& frame) {
    Encoder enc;
    std::visit(overloaded{
        [&](const SyncFrame& f) {
            enc.write_var_uint(static_cast<uint64_t>(FrameKind::Sync));
            enc.write_var_uint(static_cast<uint64_t>(f.type));
            enc.write_var_bytes(f.data);
        },
        [&](const AwarenessFrame& f) {
            enc.write_var_uint(static_cast<uint64_t>(FrameKind::Awareness));
            enc.write_var_bytes(f.update);
        },
        [&](const QueryAwarenessFrame&) {
            enc.write_var_uint(static_cast<uint64_t>(FrameKind::QueryAwareness));
        },
    }, frame);
    return enc.take();
}

Result<Frame, Error> decode_frame(std::span<const uint8_t> data) {
    if (data.empty()) {
        return decode_error("Empty frame");
    }

    Decoder dec(data);
    auto kind = dec.read_var_uint();
    if (kind.is_err()) {
        return Result<Frame, Error>::err(kind.unwrap_err());
    }

    switch (kind.unwrap()) {
        case static_cast<uint64_t>(FrameKind::Sync): {
            auto sub = dec.read_var_uint();
            if (sub.is_err()) {
                return Result<Frame, Error>::err(sub.unwrap_err());
            }
            if (sub.unwrap() > static_cast<uint64_t>(SyncMessageType::Update)) {
                return decode_error("Unknown sync message type " + std::to_string(sub.unwrap()));
            }
            auto body = dec.read_var_bytes();
            if (body.is_err()) {
                return Result<Frame, Error>::err(body.unwrap_err());
            }
            return Result<Frame, Error>::ok(SyncFrame{
                .type = static_cast<SyncMessageType>(sub.unwrap()),
                .data = std::move(body).unwrap()
            });
        }
        case static_cast<uint64_t>(FrameKind::Awareness): {
            auto update = dec.read_var_bytes();
            if (update.is_err()) {
                return Result<Frame, Error>::err(update.unwrap_err());
            }
            return Result<Frame, Error>::ok(AwarenessFrame{std::move(update).unwrap()});
        }
        case static_cast<uint64_t>(FrameKind::QueryAwareness):
            return Result<Frame, Error>::ok(QueryAwarenessFrame{});
        default:
            return decode_error("Unknown frame kind " + std::to_string(kind.unwrap()));
    }
}

const char* frame_name(const Frame& frame) {
    return std::visit(overloaded{
        [](const SyncFrame& f) -> const char* {
            switch (f.type) {
                case SyncMessageType::Step1: return "sync-step1";
                case SyncMessageType::Step2: return "sync-step2";
                case SyncMessageType::Update: return "sync-update";
            }
            return "sync";
        },
        [](const AwarenessFrame&) -> const char* { return "awareness"; },
        [](const QueryAwarenessFrame&) -> const char* { return "query-awareness"; },
    }, frame);
}

} // namespace weave::protocol
