#pragma once

#include "core/types.hpp"
#include "presence/presence_state.hpp"
#include "presence/presence_table.hpp"

#include <QObject>
#include <QPointer>
#include <QRectF>
#include <QTimer>

#include <optional>
#include <vector>

namespace weave::presence {

/**
 * EditingSurface - what the cursor layer needs from the host editor.
 *
 * Node keys are the host's own identifiers; the engine only stores and
 * compares them. Geometry is in the surface's coordinate space.
 */
class EditingSurface {
public:
    virtual ~EditingSurface() = default;

    /**
     * Current local selection, or std::nullopt when there is none.
     */
    [[nodiscard]] virtual std::optional<CursorRange> currentSelection() const = 0;

    [[nodiscard]] virtual bool containsNode(const QString& key) const = 0;

    /**
     * Caret rectangle at a point; std::nullopt if the point cannot be laid out.
     */
    [[nodiscard]] virtual std::optional<QRectF> caretRect(const TextPoint& point) const = 0;

    /**
     * Highlight rectangles covering the range between two points.
     */
    [[nodiscard]] virtual std::vector<QRectF> rangeRects(const TextPoint& anchor,
                                                        const TextPoint& focus) const = 0;
};

struct CaretPosition {
    double x = 0;
    double y = 0;
    double height = 20;

    bool operator==(const CaretPosition&) const = default;
};

/**
 * A remote collaborator's cursor, resolved against the local surface.
 */
struct RemoteCursor {
    ClientId clientId = 0;
    UserIdentity user;
    std::optional<CursorRange> cursor;
    std::optional<SelectionRefs> selection;
    std::optional<CaretPosition> position;   // null when the selection cannot be placed
    std::vector<QRectF> selectionRects;
    bool isActive = false;
    qint64 lastActive = 0;
};

/**
 * CursorBroadcaster - publishes the local selection into the presence table
 * and turns remote selections into renderable geometry.
 *
 * Publishing is rate limited: a change arriving more than two debounce
 * windows after the previous publish goes out at once; otherwise a trailing
 * publish is (re)scheduled one window later and carries the latest selection.
 */
class CursorBroadcaster : public QObject {
    Q_OBJECT

public:
    struct Options {
        int debounce_ms = 50;
        int inactive_timeout_ms = 30000;
    };

    CursorBroadcaster(PresenceTable* table, EditingSurface* surface, UserIdentity user,
                      Options options, QObject* parent = nullptr, NowFn now = {});
    ~CursorBroadcaster() override;

    /**
     * Host hook: the local selection changed.
     */
    void selectionChanged();

    /**
     * Host hook: scroll or resize moved content; re-resolve geometry.
     */
    void layoutChanged();

    /**
     * Stop publishing and clear our cursor field. Safe to call twice.
     */
    void detach();

    [[nodiscard]] const std::vector<RemoteCursor>& remoteCursors() const { return remote_; }
    [[nodiscard]] bool publishPending() const { return debounce_timer_.isActive(); }
    [[nodiscard]] bool isAttached() const { return attached_; }

public slots:
    void recompute();

signals:
    void remoteCursorsChanged(const std::vector<weave::presence::RemoteCursor>& cursors);

private:
    void publish();
    [[nodiscard]] CursorState captureLocal() const;
    [[nodiscard]] RemoteCursor resolve(const PresenceEntry& entry, qint64 now_ms) const;

    QPointer<PresenceTable> table_;
    EditingSurface* surface_;
    UserIdentity user_;
    Options options_;
    NowFn now_;
    QTimer debounce_timer_;
    std::optional<qint64> last_publish_ms_;
    std::vector<RemoteCursor> remote_;
    QMetaObject::Connection table_connection_;
    bool attached_ = true;
};

} // namespace weave::presence
