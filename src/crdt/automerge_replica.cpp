#include "crdt/automerge_replica.hpp"
#include "core/logging.hpp"
#include "protocol/varint.hpp"

#include <algorithm>
#include <cstring>
#include <span>

namespace weave::crdt {

namespace am = automerge_cpp;

namespace {

Bytes to_bytes(const std::vector<std::byte>& raw) {
    Bytes out(raw.size());
    if (!raw.empty()) {
        std::memcpy(out.data(), raw.data(), raw.size());
    }
    return out;
}

std::span<const std::byte> as_byte_span(const Bytes& bytes) {
    return std::as_bytes(std::span<const uint8_t>(bytes.data(), bytes.size()));
}

bool contains_all(const std::vector<am::ChangeHash>& haystack,
                  const std::vector<am::ChangeHash>& needles) {
    return std::all_of(needles.begin(), needles.end(), [&](const am::ChangeHash& h) {
        return std::find(haystack.begin(), haystack.end(), h) != haystack.end();
    });
}

} // namespace

Bytes encode_heads(const std::vector<am::ChangeHash>& heads) {
    protocol::Encoder enc;
    enc.write_var_uint(heads.size());
    for (const auto& head : heads) {
        const auto* raw = reinterpret_cast<const uint8_t*>(head.bytes.data());
        enc.write_raw(std::span<const uint8_t>(raw, am::ChangeHash::size));
    }
    return enc.take();
}

Result<std::vector<am::ChangeHash>, Error> decode_heads(const Bytes& state_vector) {
    using R = Result<std::vector<am::ChangeHash>, Error>;
    if (state_vector.empty()) {
        return R::ok({});
    }

    protocol::Decoder dec(state_vector);
    auto count = dec.read_var_uint();
    if (count.is_err()) {
        return R::err(count.unwrap_err());
    }
    if (count.unwrap() > dec.remaining() / am::ChangeHash::size) {
        return R::err(Error{"State vector truncated", ErrorCode::ProtocolDecode});
    }

    const auto rest = dec.read_rest();
    std::vector<am::ChangeHash> heads(static_cast<size_t>(count.unwrap()));
    for (size_t i = 0; i < heads.size(); ++i) {
        std::memcpy(heads[i].bytes.data(), rest.data() + i * am::ChangeHash::size,
                    am::ChangeHash::size);
    }
    return R::ok(std::move(heads));
}

AutomergeReplica::AutomergeReplica(QObject* parent)
    : DocumentReplica(parent)
{
}

AutomergeReplica::~AutomergeReplica() = default;

Result<void, Error> AutomergeReplica::applyUpdate(const Bytes& update, const UpdateOrigin& origin) {
    if (update.empty()) {
        return Result<void, Error>::ok();
    }

    auto incoming = am::Document::load(as_byte_span(update));
    if (!incoming) {
        return Result<void, Error>::err(
            Error{"Update is not a valid automerge document", ErrorCode::ProtocolDecode});
    }

    const auto before = doc_.get_heads();
    doc_.merge(*incoming);
    if (doc_.get_heads() != before) {
        qCDebug(lcSync) << "automerge: merged update" << update.size()
                        << "bytes from" << describe(origin);
        emit updated(update, origin);
    }
    return Result<void, Error>::ok();
}

Result<Bytes, Error> AutomergeReplica::encodeUpdate(const Bytes& remote_state_vector) const {
    auto remote_heads = decode_heads(remote_state_vector);
    if (remote_heads.is_err()) {
        return Result<Bytes, Error>::err(remote_heads.unwrap_err());
    }

    const auto local_heads = doc_.get_heads();
    if (!remote_state_vector.empty() && contains_all(remote_heads.unwrap(), local_heads)) {
        return Result<Bytes, Error>::ok(Bytes{});
    }
    return Result<Bytes, Error>::ok(to_bytes(doc_.save()));
}

Bytes AutomergeReplica::stateVector() const {
    return encode_heads(doc_.get_heads());
}

void AutomergeReplica::transact(const std::function<void(am::Transaction&)>& fn) {
    const auto before = doc_.get_heads();
    doc_.transact(fn);
    if (doc_.get_heads() != before) {
        emit updated(to_bytes(doc_.save()), UpdateOrigin::local());
    }
}

void AutomergeReplica::setText(const std::string& key, const std::string& value) {
    transact([&](am::Transaction& tx) {
        tx.put(am::root, key, value);
    });
}

std::optional<std::string> AutomergeReplica::text(const std::string& key) const {
    return doc_.get<std::string>(am::root, key);
}

std::vector<std::string> AutomergeReplica::keys() const {
    return doc_.keys(am::root);
}

} // namespace weave::crdt
