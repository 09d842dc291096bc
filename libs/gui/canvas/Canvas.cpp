#include "Canvas.hpp"

namespace {

enum class Edge { Left, Right, Top, Bottom };

bool inside(const QPointF& p, Edge edge, double bound) {
    switch (edge) {
        case Edge::Left:   return p.x() >= bound;
        case Edge::Right:  return p.x() <= bound;
        case Edge::Top:    return p.y() >= bound;
        case Edge::Bottom: return p.y() <= bound;
    }
    return false;
}

// Only called when exactly one of a, b is inside, so the divisor is non-zero
QPointF intersect(const QPointF& a, const QPointF& b, Edge edge, double bound) {
    if (edge == Edge::Left || edge == Edge::Right) {
        double t = (bound - a.x()) / (b.x() - a.x());
        return QPointF(bound, a.y() + t * (b.y() - a.y()));
    }
    double t = (bound - a.y()) / (b.y() - a.y());
    return QPointF(a.x() + t * (b.x() - a.x()), bound);
}

QPolygonF clipPolygonEdge(const QPolygonF& pts, Edge edge, double bound) {
    QPolygonF clipped;
    for (int i = 0; i < pts.size(); ++i) {
        const QPointF& cur = pts[i];
        const QPointF& next = pts[(i + 1) % pts.size()];
        bool curIn = inside(cur, edge, bound);
        bool nextIn = inside(next, edge, bound);

        if (curIn && nextIn) {
            clipped << cur;
        } else if (curIn) {
            clipped << cur << intersect(cur, next, edge, bound);
        } else if (nextIn) {
            clipped << intersect(cur, next, edge, bound);
        }
    }
    return clipped;
}

std::vector<QPolygonF> clipLineEdge(const QPolygonF& pts, Edge edge, double bound) {
    std::vector<QPolygonF> pieces;
    QPolygonF piece;
    for (int i = 1; i < pts.size(); ++i) {
        const QPointF& cur = pts[i - 1];
        const QPointF& next = pts[i];
        bool curIn = inside(cur, edge, bound);
        bool nextIn = inside(next, edge, bound);

        if (curIn && nextIn) {
            piece << cur;
        } else if (curIn) {
            piece << cur << intersect(cur, next, edge, bound);
            pieces.push_back(piece);
            piece.clear();
        } else if (nextIn) {
            piece << intersect(cur, next, edge, bound);
        }

        if (nextIn && i == pts.size() - 1) {
            piece << next;
        }
    }
    if (piece.size() > 1) {
        pieces.push_back(piece);
    }
    return pieces;
}

std::vector<QPolygonF> clipLinesAgainst(const std::vector<QPolygonF>& lines, Edge edge, double bound) {
    std::vector<QPolygonF> out;
    for (const auto& line : lines) {
        auto pieces = clipLineEdge(line, edge, bound);
        out.insert(out.end(), pieces.begin(), pieces.end());
    }
    return out;
}

} // namespace

bool Canvas::contains(const QPointF& p) const {
    return p.x() >= m_area.left() && p.x() <= m_area.right() &&
           p.y() >= m_area.top() && p.y() <= m_area.bottom();
}

QPolygonF Canvas::clipPolygonY(const QPolygonF& polygon) const {
    if (polygon.isEmpty()) return polygon;
    QPolygonF clipped = clipPolygonEdge(polygon, Edge::Top, m_area.top());
    if (clipped.isEmpty()) return clipped;
    return clipPolygonEdge(clipped, Edge::Bottom, m_area.bottom());
}

std::vector<QPolygonF> Canvas::clipLinesY(const std::vector<QPolygonF>& lines) const {
    return clipLinesAgainst(clipLinesAgainst(lines, Edge::Top, m_area.top()),
                            Edge::Bottom, m_area.bottom());
}

std::vector<QPolygonF> Canvas::clipLinesXY(const std::vector<QPolygonF>& lines) const {
    auto clipped = clipLinesAgainst(lines, Edge::Left, m_area.left());
    clipped = clipLinesAgainst(clipped, Edge::Right, m_area.right());
    return clipLinesY(clipped);
}
