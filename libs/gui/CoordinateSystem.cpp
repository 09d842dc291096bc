#include "CoordinateSystem.h"
#include "CandlewickLogging.hpp"

QPointF CoordinateSystem::worldToScreen(double x, double y, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        cwLog_Warning("Invalid viewport:" << viewportDebugString(viewport));
        return QPointF(0, 0);
    }

    const QRectF& area = viewport.area;
    double sx = area.left() + normalizeX(x, viewport) * area.width();
    double sy = area.bottom() - normalizeY(y, viewport) * area.height();  // Flip Y for screen coordinates

    return QPointF(sx, sy);
}

QPointF CoordinateSystem::screenToWorld(const QPointF& screenPos, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        return QPointF(0, 0);
    }

    const QRectF& area = viewport.area;
    double nx = (screenPos.x() - area.left()) / area.width();
    double ny = (area.bottom() - screenPos.y()) / area.height();

    return QPointF(viewport.xMin + nx * (viewport.xMax - viewport.xMin),
                   viewport.yMin + ny * (viewport.yMax - viewport.yMin));
}

PlotTransform CoordinateSystem::transforms(const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        cwLog_Warning("Invalid viewport:" << viewportDebugString(viewport));
        const QPointF origin = viewport.area.bottomLeft();
        return PlotTransform{
            [origin](double) { return origin.x(); },
            [origin](double) { return origin.y(); }
        };
    }

    return PlotTransform{
        [viewport](double x) { return viewport.area.left() + normalizeX(x, viewport) * viewport.area.width(); },
        [viewport](double y) { return viewport.area.bottom() - normalizeY(y, viewport) * viewport.area.height(); }
    };
}

bool CoordinateSystem::validateViewport(const Viewport& viewport) {
    return viewport.xMax > viewport.xMin &&
           viewport.yMax > viewport.yMin &&
           viewport.area.width() > EPSILON &&
           viewport.area.height() > EPSILON;
}

QString CoordinateSystem::viewportDebugString(const Viewport& viewport) {
    return QString("Viewport{x: %1-%2, y: %3-%4, area: %5,%6 %7x%8}")
        .arg(viewport.xMin)
        .arg(viewport.xMax)
        .arg(viewport.yMin)
        .arg(viewport.yMax)
        .arg(viewport.area.left())
        .arg(viewport.area.top())
        .arg(viewport.area.width())
        .arg(viewport.area.height());
}

double CoordinateSystem::normalizeX(double x, const Viewport& viewport) {
    double range = viewport.xMax - viewport.xMin;
    if (range <= EPSILON) return 0.0;

    return (x - viewport.xMin) / range;
}

double CoordinateSystem::normalizeY(double y, const Viewport& viewport) {
    double range = viewport.yMax - viewport.yMin;
    if (range <= EPSILON) return 0.0;

    return (y - viewport.yMin) / range;
}
