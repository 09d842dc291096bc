/*
Candlewick: Canvas
Role: Abstract 2D drawing surface with a visible area and clipping against that area.
Inputs/Outputs: Receives polygons/polylines in canvas coordinates; concrete surfaces turn them into pixels.
Threading: Single render pass on one thread; no internal state besides the area.
Related: Canvas.cpp, PainterCanvas.hpp, CandleChart.hpp, tests/fixtures/spy_canvas.hpp.
Assumptions: Clipping is inclusive: points lying exactly on the boundary are inside.
*/
#pragma once
#include <QPointF>
#include <QPolygonF>
#include <QRectF>
#include <vector>
#include "DrawStyles.hpp"

class Canvas {
public:
    explicit Canvas(const QRectF& area) : m_area(area.normalized()) {}
    virtual ~Canvas() = default;

    const QRectF& area() const { return m_area; }
    bool contains(const QPointF& p) const;

    // Drawing primitives; empty input is a no-op for concrete canvases
    virtual void fillPolygon(const QColor& color, const QPolygonF& polygon) = 0;
    virtual void strokeLines(const LineStyle& style, const std::vector<QPolygonF>& lines) = 0;
    virtual void drawGlyph(const GlyphStyle& style, const QPointF& center) = 0;

    // Closed polygon clipped to the vertical extent (Sutherland-Hodgman)
    QPolygonF clipPolygonY(const QPolygonF& polygon) const;

    // Open polylines clipped to the vertical extent; a polyline leaving and
    // re-entering the area is split into several pieces
    std::vector<QPolygonF> clipLinesY(const std::vector<QPolygonF>& lines) const;

    // Same as clipLinesY but against all four edges
    std::vector<QPolygonF> clipLinesXY(const std::vector<QPolygonF>& lines) const;

private:
    QRectF m_area;
};
