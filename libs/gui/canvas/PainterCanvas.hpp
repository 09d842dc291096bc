#pragma once
#include "Canvas.hpp"

class QPainter;

/**
 * PainterCanvas - Canvas that draws through a QPainter (image, widget, printer).
 * The painter must outlive the canvas.
 */
class PainterCanvas : public Canvas {
public:
    PainterCanvas(QPainter& painter, const QRectF& area);

    void fillPolygon(const QColor& color, const QPolygonF& polygon) override;
    void strokeLines(const LineStyle& style, const std::vector<QPolygonF>& lines) override;
    void drawGlyph(const GlyphStyle& style, const QPointF& center) override;

private:
    QPainter& m_painter;
};
