#pragma once

#include "crdt/automerge_replica.hpp"
#include "presence/cursor_broadcaster.hpp"

#include <QPointer>

#include <optional>

namespace weave::cli {

/**
 * TextSurface - line-per-key view of the document for the terminal client.
 *
 * Each root key of the replica is one line, in key order. Geometry is a
 * fixed character grid, so remote cursors resolve to (column, line) cells.
 */
class TextSurface : public presence::EditingSurface {
public:
    static constexpr double CHAR_WIDTH = 8;
    static constexpr double LINE_HEIGHT = 20;

    explicit TextSurface(crdt::AutomergeReplica* replica);

    void setSelection(const presence::CursorRange& range);
    void clearSelection();

    [[nodiscard]] std::optional<presence::CursorRange> currentSelection() const override;
    [[nodiscard]] bool containsNode(const QString& key) const override;
    [[nodiscard]] std::optional<QRectF> caretRect(const presence::TextPoint& point) const override;
    [[nodiscard]] std::vector<QRectF> rangeRects(const presence::TextPoint& anchor,
                                                const presence::TextPoint& focus) const override;

private:
    [[nodiscard]] std::optional<int> lineOf(const QString& key) const;
    [[nodiscard]] int lineLength(const QString& key) const;

    QPointer<crdt::AutomergeReplica> replica_;
    std::optional<presence::CursorRange> selection_;
};

} // namespace weave::cli
