/*
Candlewick: Plot
Role: Chart surface: axes, title, tick labels and a data canvas that registered plotters draw onto.
Inputs/Outputs: Plotters in registration order; renders into a QPainter or a PNG/JPEG file.
Threading: Build and draw on one thread; QFont use requires a QGuiApplication.
Integration: Used by QuickPlot helpers and the candlewick CLI.
Observability: Logs saves and failures to the app category.
Related: Plot.cpp, IPlotter.hpp, TickMarker.hpp, CoordinateSystem.h.
*/
#pragma once
#include <QColor>
#include <QRectF>
#include <QString>
#include <QStringList>
#include <limits>
#include <utility>
#include <memory>
#include <vector>
#include "../CoordinateSystem.h"
#include "../models/TickMarker.hpp"
#include "../render/IPlotter.hpp"

class QPainter;
class IChartTheme;

struct Axis {
    QString label;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    std::shared_ptr<const ITickMarker> tickMarker;

    bool showLine = true;
    qreal tickLength = 8.0;   // major tick length in pixels; 0 hides tick marks

    // Widen [min, max] to include the given values
    void extend(double lo, double hi);

    // Range used for drawing: [0,1] without data, +-1 around a single value
    std::pair<double, double> displayRange() const;
};

class Plot {
public:
    Plot();

    // Presentation
    void setTitle(const QString& title) { m_title = title; }
    const QString& title() const { return m_title; }
    void applyTheme(const IChartTheme& theme);
    const QColor& background() const { return m_background; }
    const QColor& foreground() const { return m_foreground; }

    Axis& xAxis() { return m_x; }
    Axis& yAxis() { return m_y; }
    const Axis& xAxis() const { return m_x; }
    const Axis& yAxis() const { return m_y; }

    /**
     * Register a plotter. Data rangers widen both axes immediately, so axis
     * limits assigned after add() take precedence over autoscaling.
     */
    void add(std::shared_ptr<IPlotter> plotter);
    const std::vector<std::shared_ptr<IPlotter>>& plotters() const { return m_plotters; }

    // Categorical X axis: label i sits at position i; hides the X axis line and tick marks
    void nominalX(const QStringList& labels);

    // Current axis display ranges mapped onto the canvas area
    Viewport viewport(const Canvas& canvas) const;

    // Data→canvas mapping for the current axis ranges onto the canvas area
    PlotTransform transforms(const Canvas& canvas) const;

    // Render the whole plot into area; dataArea() reports where plotters drew
    void draw(QPainter& painter, const QRectF& area) const;
    QRectF dataArea(QPainter& painter, const QRectF& area) const;

    // Render into an image of the given size; false when the file cannot be written
    bool save(int widthPx, int heightPx, const QString& path) const;

private:
    void drawAxes(QPainter& painter, const QRectF& data) const;

    QString m_title;
    Axis m_x;
    Axis m_y;
    QColor m_background = Qt::white;
    QColor m_foreground = Qt::black;
    std::vector<std::shared_ptr<IPlotter>> m_plotters;
};
