#include "PainterCanvas.hpp"
#include <QPainter>
#include <QPen>

PainterCanvas::PainterCanvas(QPainter& painter, const QRectF& area)
    : Canvas(area), m_painter(painter) {
    m_painter.setRenderHint(QPainter::Antialiasing, true);
}

void PainterCanvas::fillPolygon(const QColor& color, const QPolygonF& polygon) {
    if (polygon.size() < 3) return;

    m_painter.save();
    m_painter.setPen(Qt::NoPen);
    m_painter.setBrush(color);
    m_painter.drawPolygon(polygon);
    m_painter.restore();
}

void PainterCanvas::strokeLines(const LineStyle& style, const std::vector<QPolygonF>& lines) {
    if (lines.empty() || style.width <= 0.0) return;

    m_painter.save();
    QPen pen(style.color, style.width);
    pen.setCapStyle(Qt::SquareCap);
    pen.setJoinStyle(Qt::MiterJoin);
    m_painter.setPen(pen);
    m_painter.setBrush(Qt::NoBrush);
    for (const auto& line : lines) {
        if (line.size() < 2) continue;
        m_painter.drawPolyline(line);
    }
    m_painter.restore();
}

void PainterCanvas::drawGlyph(const GlyphStyle& style, const QPointF& center) {
    if (style.radius <= 0.0) return;

    m_painter.save();
    m_painter.setPen(QPen(style.color, 1.0));
    m_painter.setBrush(Qt::NoBrush);
    m_painter.drawEllipse(center, style.radius, style.radius);
    m_painter.restore();
}
