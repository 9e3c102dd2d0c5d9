#include "cli/text_surface.hpp"

#include <algorithm>

namespace weave::cli {

TextSurface::TextSurface(crdt::AutomergeReplica* replica)
    : replica_(replica)
{
}

void TextSurface::setSelection(const presence::CursorRange& range) {
    selection_ = range;
}

void TextSurface::clearSelection() {
    selection_.reset();
}

std::optional<presence::CursorRange> TextSurface::currentSelection() const {
    return selection_;
}

bool TextSurface::containsNode(const QString& key) const {
    return lineOf(key).has_value();
}

std::optional<int> TextSurface::lineOf(const QString& key) const {
    if (!replica_) return std::nullopt;
    const auto keys = replica_->keys();
    const auto it = std::find(keys.begin(), keys.end(), key.toStdString());
    if (it == keys.end()) return std::nullopt;
    return static_cast<int>(std::distance(keys.begin(), it));
}

int TextSurface::lineLength(const QString& key) const {
    if (!replica_) return 0;
    const auto text = replica_->text(key.toStdString());
    return text ? static_cast<int>(QString::fromStdString(*text).size()) : 0;
}

std::optional<QRectF> TextSurface::caretRect(const presence::TextPoint& point) const {
    const auto line = lineOf(point.key);
    if (!line) return std::nullopt;
    const int column = std::clamp(point.offset, 0, lineLength(point.key));
    return QRectF(column * CHAR_WIDTH, *line * LINE_HEIGHT, 1, LINE_HEIGHT);
}

std::vector<QRectF> TextSurface::rangeRects(const presence::TextPoint& anchor,
                                            const presence::TextPoint& focus) const {
    auto anchor_line = lineOf(anchor.key);
    auto focus_line = lineOf(focus.key);
    if (!anchor_line || !focus_line) return {};

    // Order the endpoints top to bottom, left to right.
    presence::TextPoint start = anchor;
    presence::TextPoint end = focus;
    int start_line = *anchor_line;
    int end_line = *focus_line;
    if (end_line < start_line || (end_line == start_line && end.offset < start.offset)) {
        std::swap(start, end);
        std::swap(start_line, end_line);
    }

    const auto keys = replica_->keys();
    std::vector<QRectF> rects;
    for (int line = start_line; line <= end_line; ++line) {
        const QString key = QString::fromStdString(keys[static_cast<size_t>(line)]);
        const int length = lineLength(key);
        const int from = line == start_line ? std::clamp(start.offset, 0, length) : 0;
        const int to = line == end_line ? std::clamp(end.offset, 0, length) : length;
        if (to > from) {
            rects.emplace_back(from * CHAR_WIDTH, line * LINE_HEIGHT,
                               (to - from) * CHAR_WIDTH, LINE_HEIGHT);
        }
    }
    return rects;
}

} // namespace weave::cli
