#pragma once
#include "../IPlotter.hpp"
#include "../../canvas/DrawStyles.hpp"
#include <QPointF>
#include <vector>

using XYs = std::vector<QPointF>;

// Points (i, y[i]) for a plain series
XYs indexedXYs(const std::vector<double>& y);

// Points (x[i], y[i]); throws candlewick::LengthMismatchError when sizes differ
XYs pairedXYs(const std::vector<double>& x, const std::vector<double>& y);

/**
 * LinePlotter - polyline through XY points, clipped to the whole canvas.
 * Throws candlewick::EmptyInputError for no points and
 * candlewick::ChartInputError for NaN/Inf coordinates.
 */
class LinePlotter : public IPlotter, public IDataRanger {
public:
    explicit LinePlotter(XYs points, LineStyle style = LineStyle{});

    void plot(Canvas& canvas, const Plot& plot) const override;
    const char* getPlotterName() const override { return "Line"; }
    DataRange dataRange() const override;

    const XYs& points() const { return m_points; }

private:
    XYs m_points;
    LineStyle m_style;
};

/**
 * ScatterPlotter - one glyph per XY point; points outside the canvas are skipped.
 */
class ScatterPlotter : public IPlotter, public IDataRanger {
public:
    explicit ScatterPlotter(XYs points, GlyphStyle style = GlyphStyle{});

    void plot(Canvas& canvas, const Plot& plot) const override;
    const char* getPlotterName() const override { return "Scatter"; }
    DataRange dataRange() const override;

    void setRadius(qreal radius) { m_style.radius = radius; }
    const XYs& points() const { return m_points; }

private:
    XYs m_points;
    GlyphStyle m_style;
};
