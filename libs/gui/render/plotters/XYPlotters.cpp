#include "XYPlotters.hpp"
#include "../../canvas/Canvas.hpp"
#include "../../CoordinateSystem.h"
#include "../../plot/Plot.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace {

void validatePoints(const XYs& points, const char* who) {
    if (points.empty()) {
        throw candlewick::EmptyInputError(std::string(who) + ": no points to plot");
    }
    for (const auto& p : points) {
        if (!std::isfinite(p.x()) || !std::isfinite(p.y())) {
            throw candlewick::ChartInputError(std::string(who) + ": NaN or Inf coordinate");
        }
    }
}

DataRange xyRange(const XYs& points) {
    DataRange range{points.front().x(), points.front().x(), points.front().y(), points.front().y()};
    for (const auto& p : points) {
        range.xMin = std::min(range.xMin, p.x());
        range.xMax = std::max(range.xMax, p.x());
        range.yMin = std::min(range.yMin, p.y());
        range.yMax = std::max(range.yMax, p.y());
    }
    return range;
}

} // namespace

XYs indexedXYs(const std::vector<double>& y) {
    XYs points;
    points.reserve(y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        points.emplace_back(static_cast<double>(i), y[i]);
    }
    return points;
}

XYs pairedXYs(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw candlewick::LengthMismatchError("x and y must have the same length ("
            + std::to_string(x.size()) + " vs " + std::to_string(y.size()) + ")");
    }
    XYs points;
    points.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        points.emplace_back(x[i], y[i]);
    }
    return points;
}

LinePlotter::LinePlotter(XYs points, LineStyle style)
    : m_points(std::move(points)), m_style(std::move(style)) {
    validatePoints(m_points, "LinePlotter");
}

void LinePlotter::plot(Canvas& canvas, const Plot& plot) const {
    const PlotTransform tr = plot.transforms(canvas);

    QPolygonF line;
    line.reserve(static_cast<int>(m_points.size()));
    for (const auto& p : m_points) {
        line << QPointF(tr.x(p.x()), tr.y(p.y()));
    }
    canvas.strokeLines(m_style, canvas.clipLinesXY({line}));
}

DataRange LinePlotter::dataRange() const {
    return xyRange(m_points);
}

ScatterPlotter::ScatterPlotter(XYs points, GlyphStyle style)
    : m_points(std::move(points)), m_style(std::move(style)) {
    validatePoints(m_points, "ScatterPlotter");
}

void ScatterPlotter::plot(Canvas& canvas, const Plot& plot) const {
    const Viewport viewport = plot.viewport(canvas);

    for (const auto& p : m_points) {
        const QPointF center = CoordinateSystem::worldToScreen(p.x(), p.y(), viewport);
        if (!canvas.contains(center)) continue;
        canvas.drawGlyph(m_style, center);
    }
}

DataRange ScatterPlotter::dataRange() const {
    return xyRange(m_points);
}
