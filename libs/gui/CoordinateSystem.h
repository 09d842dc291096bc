/*
Candlewick: CoordinateSystem
Role: Coordinate transformation between data space (axis position/price) and canvas space.
Inputs/Outputs: Takes data/canvas coordinates and a viewport; outputs converted coordinates or transform functions.
Threading: Stateless; all functions are pure and thread-safe.
Performance: Simple arithmetic only.
Integration: Used by Plot to hand PlotTransform objects to plotters.
Observability: Logs invalid viewports to the render category.
Related: CoordinateSystem.cpp, plot/Plot.hpp, render/plotters/CandleChart.hpp.
Assumptions: Linear mapping; larger Y values are drawn higher on screen.
*/
#pragma once
#include <QPointF>
#include <QRectF>
#include <QString>
#include <functional>

struct Viewport {
    double xMin = 0.0;
    double xMax = 1.0;
    double yMin = 0.0;
    double yMax = 1.0;
    QRectF area{0.0, 0.0, 800.0, 600.0};   // canvas rectangle the data range maps onto
};

// Independent data→canvas mappings for each axis
struct PlotTransform {
    std::function<double(double)> x;
    std::function<double(double)> y;
};

class CoordinateSystem {
public:
    // Core transformation functions (no clamping; plotters clip against the canvas)
    static QPointF worldToScreen(double x, double y, const Viewport& viewport);
    static QPointF screenToWorld(const QPointF& screenPos, const Viewport& viewport);
    static PlotTransform transforms(const Viewport& viewport);

    // Validation and debugging
    static bool validateViewport(const Viewport& viewport);
    static QString viewportDebugString(const Viewport& viewport);

private:
    static double normalizeX(double x, const Viewport& viewport);
    static double normalizeY(double y, const Viewport& viewport);
    static constexpr double EPSILON = 1e-10;
};
