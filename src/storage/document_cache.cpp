#include "storage/document_cache.hpp"
#include "storage/migrations.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QFileInfo>

namespace weave::storage {

DocumentCache::DocumentCache(std::string room, crdt::DocumentReplica* replica,
                             Options options, QObject* parent)
    : QObject(parent)
    , room_(std::move(room))
    , replica_(replica)
    , options_(options)
{
    flush_timer_.setSingleShot(true);
    flush_timer_.setInterval(0);
    connect(&flush_timer_, &QTimer::timeout, this, &DocumentCache::flush);

    if (replica_) {
        connect(replica_, &crdt::DocumentReplica::updated,
                this, &DocumentCache::onReplicaUpdated);
    }
}

DocumentCache::~DocumentCache() {
    flush();
}

Result<void, Error> DocumentCache::open(const std::string& path) {
    const auto dir = QFileInfo(QString::fromStdString(path)).absolutePath();
    QDir().mkpath(dir);

    auto db_result = Database::open(path);
    if (db_result.is_err()) {
        const Error e{db_result.unwrap_err().message, ErrorCode::Persistence};
        fail(e);
        return Result<void, Error>::err(e);
    }
    return open(std::move(db_result).unwrap());
}

Result<void, Error> DocumentCache::open(Database db) {
    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        const Error e{"cache schema: " + migrated.unwrap_err().message, ErrorCode::Persistence};
        fail(e);
        return Result<void, Error>::err(e);
    }
    db_.emplace(std::move(db));
    store_ = std::make_unique<DocumentStore>(*db_);
    return Result<void, Error>::ok();
}

void DocumentCache::hydrate() {
    if (synced_) return;

    if (store_ && replica_) {
        auto loaded = store_->load(room_);
        if (loaded.is_err()) {
            fail(loaded.unwrap_err());
        } else {
            size_t applied = 0;
            for (const auto& update : loaded.unwrap()) {
                auto r = replica_->applyUpdate(update, crdt::UpdateOrigin::persistence());
                if (r.is_err()) {
                    // One bad row should not cost the rest of the history.
                    qCWarning(lcStorage) << "cache: skipping unreadable update for room"
                                         << QString::fromStdString(room_)
                                         << QString::fromStdString(r.unwrap_err().message);
                    continue;
                }
                ++applied;
            }
            qCInfo(lcStorage) << "cache: hydrated room" << QString::fromStdString(room_)
                              << "from" << applied << "records";
        }
    }

    synced_ = true;
    emit synced();
}

void DocumentCache::onReplicaUpdated(const Bytes& update, const crdt::UpdateOrigin& origin) {
    if (!store_ || origin.source == crdt::UpdateOrigin::Source::Persistence) {
        return;
    }
    pending_.push_back(update);
    if (!flush_timer_.isActive()) {
        flush_timer_.start();
    }
}

void DocumentCache::flush() {
    flush_timer_.stop();
    if (!store_ || pending_.empty()) {
        pending_.clear();
        return;
    }

    auto batch = std::move(pending_);
    pending_.clear();
    for (const auto& update : batch) {
        auto appended = store_->append_update(room_, update);
        if (appended.is_err()) {
            fail(appended.unwrap_err());
            return;
        }
    }

    auto count = store_->count_updates(room_);
    if (count.is_err()) {
        fail(count.unwrap_err());
        return;
    }
    if (count.unwrap() >= options_.trim_threshold && replica_) {
        auto compacted = store_->compact(room_, replica_->encodeStateAsUpdate());
        if (compacted.is_err()) {
            fail(compacted.unwrap_err());
            return;
        }
        qCDebug(lcStorage) << "cache: compacted room" << QString::fromStdString(room_)
                           << "after" << count.unwrap() << "updates";
    }
}

Result<void, Error> DocumentCache::clearData() {
    pending_.clear();
    flush_timer_.stop();
    if (!store_) {
        return Result<void, Error>::ok();
    }
    return store_->clear(room_);
}

void DocumentCache::fail(const Error& error) {
    qCWarning(lcStorage) << "cache: persistence error, continuing network-only:"
                         << QString::fromStdString(error.message);
    store_.reset();
    db_.reset();
    pending_.clear();
    emit errorOccurred(QString::fromStdString(error.message));
}

} // namespace weave::storage
