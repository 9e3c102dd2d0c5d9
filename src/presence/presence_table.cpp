#include "presence/presence_table.hpp"
#include "core/logging.hpp"
#include "protocol/varint.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

#include <limits>

namespace weave::presence {

namespace {

std::string encodeState(const std::optional<QJsonObject>& state) {
    if (!state) {
        return "null";
    }
    return QJsonDocument(*state).toJson(QJsonDocument::Compact).toStdString();
}

Result<std::optional<QJsonObject>, Error> decodeState(const std::string& json) {
    using R = Result<std::optional<QJsonObject>, Error>;
    if (json == "null") {
        return R::ok(std::nullopt);
    }
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return R::err(Error{"Presence state is not a JSON object", ErrorCode::ProtocolDecode});
    }
    return R::ok(doc.object());
}

struct DecodedEntry {
    ClientId client;
    quint64 clock;
    std::optional<QJsonObject> state;
};

} // namespace

std::vector<ClientId> PresenceChange::all() const {
    std::vector<ClientId> out;
    out.reserve(added.size() + updated.size() + removed.size());
    out.insert(out.end(), added.begin(), added.end());
    out.insert(out.end(), updated.begin(), updated.end());
    out.insert(out.end(), removed.begin(), removed.end());
    return out;
}

PresenceTable::PresenceTable(ClientId client_id, QObject* parent, NowFn now)
    : QObject(parent)
    , client_id_(client_id)
    , now_(now ? std::move(now) : NowFn(&Timestamp::now))
{
    // Start from an empty local entry at clock 0; the first real write is clock 1.
    states_[client_id_] = QJsonObject{};
    meta_[client_id_] = Meta{0, now_().millis()};
}

PresenceTable::~PresenceTable() = default;

std::optional<QJsonObject> PresenceTable::localState() const {
    auto it = states_.find(client_id_);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PresenceTable::setLocalState(const std::optional<QJsonObject>& state,
                                  const crdt::UpdateOrigin& origin) {
    auto meta_it = meta_.find(client_id_);
    const quint64 clock = meta_it == meta_.end() ? 0 : meta_it->second.clock + 1;
    const auto prev = localState();

    if (state) {
        states_[client_id_] = *state;
    } else {
        states_.erase(client_id_);
    }
    meta_[client_id_] = Meta{clock, now_().millis()};

    PresenceChange all_updates;
    PresenceChange content_changes;
    if (!state) {
        all_updates.removed.push_back(client_id_);
    } else if (!prev) {
        all_updates.added.push_back(client_id_);
    } else {
        all_updates.updated.push_back(client_id_);
        if (*prev != *state) {
            content_changes.updated.push_back(client_id_);
        }
    }
    content_changes.added = all_updates.added;
    content_changes.removed = all_updates.removed;

    if (!content_changes.empty()) {
        emit changed(content_changes, origin);
    }
    emit updated(all_updates, origin);
}

void PresenceTable::setLocalField(const QString& field, const QJsonValue& value) {
    auto current = localState();
    if (!current) {
        return;
    }
    current->insert(field, value);
    setLocalState(current);
}

std::optional<quint64> PresenceTable::clockOf(ClientId client) const {
    auto it = meta_.find(client);
    if (it == meta_.end()) {
        return std::nullopt;
    }
    return it->second.clock;
}

std::vector<ClientId> PresenceTable::remoteClientIds() const {
    std::vector<ClientId> out;
    for (const auto& [client, _] : states_) {
        if (client != client_id_) {
            out.push_back(client);
        }
    }
    return out;
}

Bytes PresenceTable::encodeUpdate(const std::vector<ClientId>& clients) const {
    protocol::Encoder enc;
    enc.write_var_uint(clients.size());
    for (ClientId client : clients) {
        auto meta_it = meta_.find(client);
        auto state_it = states_.find(client);
        std::optional<QJsonObject> state;
        if (state_it != states_.end()) {
            state = state_it->second;
        }
        enc.write_var_uint(client);
        enc.write_var_uint(meta_it == meta_.end() ? 0 : meta_it->second.clock);
        enc.write_var_string(encodeState(state));
    }
    return enc.take();
}

Bytes PresenceTable::encodeAll() const {
    std::vector<ClientId> clients;
    clients.reserve(states_.size());
    for (const auto& [client, _] : states_) {
        clients.push_back(client);
    }
    return encodeUpdate(clients);
}

Bytes PresenceTable::encodeRemoval(const std::vector<ClientId>& clients) const {
    protocol::Encoder enc;
    enc.write_var_uint(clients.size());
    for (ClientId client : clients) {
        auto meta_it = meta_.find(client);
        enc.write_var_uint(client);
        enc.write_var_uint(meta_it == meta_.end() ? 0 : meta_it->second.clock);
        enc.write_var_string(encodeState(std::nullopt));
    }
    return enc.take();
}

Result<void, Error> PresenceTable::applyUpdate(const Bytes& update,
                                               const crdt::UpdateOrigin& origin) {
    protocol::Decoder dec(update);
    auto count = dec.read_var_uint();
    if (count.is_err()) {
        return Result<void, Error>::err(count.unwrap_err());
    }

    std::vector<DecodedEntry> entries;
    for (uint64_t i = 0; i < count.unwrap(); ++i) {
        auto client = dec.read_var_uint();
        if (client.is_err()) return Result<void, Error>::err(client.unwrap_err());
        auto clock = dec.read_var_uint();
        if (clock.is_err()) return Result<void, Error>::err(clock.unwrap_err());
        auto json = dec.read_var_string();
        if (json.is_err()) return Result<void, Error>::err(json.unwrap_err());
        auto state = decodeState(json.unwrap());
        if (state.is_err()) return Result<void, Error>::err(state.unwrap_err());
        if (client.unwrap() > std::numeric_limits<ClientId>::max()) {
            return Result<void, Error>::err(
                Error{"Presence client id out of range", ErrorCode::ProtocolDecode});
        }
        entries.push_back(DecodedEntry{
            static_cast<ClientId>(client.unwrap()),
            clock.unwrap(),
            std::move(state).unwrap()
        });
    }

    const qint64 now = now_().millis();
    PresenceChange all_updates;
    PresenceChange content_changes;

    for (auto& entry : entries) {
        auto meta_it = meta_.find(entry.client);
        const bool known = meta_it != meta_.end();
        const quint64 current_clock = known ? meta_it->second.clock : 0;
        const bool has_state = states_.count(entry.client) > 0;

        const bool newer = current_clock < entry.clock;
        const bool tie_removal = current_clock == entry.clock && !entry.state && has_state;
        if (!newer && !tie_removal) {
            continue;
        }

        std::optional<QJsonObject> prev;
        if (has_state) {
            prev = states_[entry.client];
        }

        quint64 clock = entry.clock;
        if (!entry.state && entry.client == client_id_ && localState()) {
            // Someone declared us gone; outbid them on our next broadcast.
            meta_[entry.client] = Meta{clock + 1, now};
            all_updates.updated.push_back(entry.client);
            continue;
        }
        if (!entry.state) {
            states_.erase(entry.client);
        } else {
            states_[entry.client] = *entry.state;
        }
        meta_[entry.client] = Meta{clock, now};

        if (!known && entry.state) {
            all_updates.added.push_back(entry.client);
            content_changes.added.push_back(entry.client);
        } else if (known && !entry.state) {
            all_updates.removed.push_back(entry.client);
            content_changes.removed.push_back(entry.client);
        } else if (entry.state) {
            if (!prev || *prev != *entry.state) {
                content_changes.updated.push_back(entry.client);
            }
            all_updates.updated.push_back(entry.client);
        }
    }

    if (!content_changes.empty()) {
        qCDebug(lcPresence) << "presence: applied" << entries.size() << "entries from"
                            << crdt::describe(origin);
        emit changed(content_changes, origin);
    }
    if (!all_updates.empty()) {
        emit updated(all_updates, origin);
    }
    return Result<void, Error>::ok();
}

void PresenceTable::removeStates(const std::vector<ClientId>& clients,
                                 const crdt::UpdateOrigin& origin) {
    PresenceChange change;
    const qint64 now = now_().millis();
    for (ClientId client : clients) {
        if (states_.erase(client) == 0) {
            continue;
        }
        if (client == client_id_) {
            auto& meta = meta_[client];
            meta.clock += 1;
            meta.last_updated = now;
        } else {
            // Forget the clock too, so the client is accepted again when it
            // re-announces the same state after a reconnect.
            meta_.erase(client);
        }
        change.removed.push_back(client);
    }
    if (!change.empty()) {
        emit changed(change, origin);
        emit updated(change, origin);
    }
}

} // namespace weave::presence
