#include "presence/cursor_broadcaster.hpp"
#include "core/logging.hpp"

namespace weave::presence {

CursorBroadcaster::CursorBroadcaster(PresenceTable* table, EditingSurface* surface,
                                     UserIdentity user, Options options,
                                     QObject* parent, NowFn now)
    : QObject(parent)
    , table_(table)
    , surface_(surface)
    , user_(std::move(user))
    , options_(options)
    , now_(now ? std::move(now) : NowFn(&Timestamp::now))
{
    debounce_timer_.setSingleShot(true);
    debounce_timer_.setInterval(options_.debounce_ms);
    connect(&debounce_timer_, &QTimer::timeout, this, &CursorBroadcaster::publish);

    if (table_) {
        table_connection_ = connect(table_, &PresenceTable::changed, this,
                                    [this](const PresenceChange&, const crdt::UpdateOrigin&) { recompute(); });
    }
}

CursorBroadcaster::~CursorBroadcaster() {
    debounce_timer_.stop();
    QObject::disconnect(table_connection_);
}

void CursorBroadcaster::selectionChanged() {
    if (!attached_) return;

    const qint64 now = now_().millis();
    if (!last_publish_ms_ || now - *last_publish_ms_ > 2 * static_cast<qint64>(options_.debounce_ms)) {
        debounce_timer_.stop();
        publish();
        return;
    }
    debounce_timer_.start();
}

void CursorBroadcaster::layoutChanged() {
    recompute();
}

void CursorBroadcaster::detach() {
    if (!attached_) return;
    attached_ = false;
    debounce_timer_.stop();
    if (table_ && table_->localState()) {
        table_->setLocalField(fields::cursor, QJsonValue(QJsonValue::Null));
    }
}

CursorState CursorBroadcaster::captureLocal() const {
    CursorState state;
    state.user = user_;
    state.lastActive = now_().millis();

    std::optional<CursorRange> range;
    if (surface_) {
        range = surface_->currentSelection();
    }
    if (range) {
        state.cursor = range;
        state.selection = SelectionRefs{
            .anchorKey = range->anchor.key,
            .anchorOffset = range->anchor.offset,
            .focusKey = range->focus.key,
            .focusOffset = range->focus.offset
        };
    }
    return state;
}

void CursorBroadcaster::publish() {
    if (!attached_ || !table_) return;
    last_publish_ms_ = now_().millis();
    table_->setLocalField(fields::cursor, serializeCursorState(captureLocal()));
}

RemoteCursor CursorBroadcaster::resolve(const PresenceEntry& entry, qint64 now_ms) const {
    RemoteCursor out;
    out.clientId = entry.clientId;
    out.user = entry.cursor->user.id.isEmpty() && entry.user ? *entry.user : entry.cursor->user;
    out.cursor = entry.cursor->cursor;
    out.selection = entry.cursor->selection;
    out.lastActive = entry.cursor->lastActive;
    out.isActive = now_ms - out.lastActive < options_.inactive_timeout_ms;

    if (!surface_ || !out.selection) {
        return out;
    }
    const auto& sel = *out.selection;
    if (!surface_->containsNode(sel.anchorKey) || !surface_->containsNode(sel.focusKey)) {
        return out;
    }

    const TextPoint anchor{sel.anchorKey, sel.anchorOffset};
    const TextPoint focus{sel.focusKey, sel.focusOffset};
    if (auto rect = surface_->caretRect(focus)) {
        out.position = CaretPosition{
            .x = rect->x(),
            .y = rect->y(),
            .height = rect->height() > 0 ? rect->height() : 20.0
        };
    }
    if (anchor != focus) {
        out.selectionRects = surface_->rangeRects(anchor, focus);
    }
    return out;
}

void CursorBroadcaster::recompute() {
    if (!table_) return;

    const qint64 now = now_().millis();
    std::vector<RemoteCursor> cursors;
    for (const auto& [client, state] : table_->states()) {
        if (client == table_->clientId()) {
            continue;
        }
        const auto entry = parsePresenceEntry(client, state);
        if (!entry.cursor) {
            continue;
        }
        cursors.push_back(resolve(entry, now));
    }
    remote_ = std::move(cursors);
    qCDebug(lcPresence) << "cursors: resolved" << remote_.size() << "remote cursors";
    emit remoteCursorsChanged(remote_);
}

} // namespace weave::presence
