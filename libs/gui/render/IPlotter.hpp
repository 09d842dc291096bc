#pragma once

class Canvas;
class Plot;

// Bounding box of a plotter's data in data space
struct DataRange {
    double xMin = 0.0;
    double xMax = 0.0;
    double yMin = 0.0;
    double yMax = 0.0;
};

/**
 * IPlotter - a component drawn onto a Plot's data canvas.
 * Plotters are drawn in the order they were added to the plot.
 */
class IPlotter {
public:
    virtual ~IPlotter() = default;

    virtual void plot(Canvas& canvas, const Plot& plot) const = 0;
    virtual const char* getPlotterName() const = 0;
};

/**
 * IDataRanger - plotters whose data range feeds axis autoscaling.
 */
class IDataRanger {
public:
    virtual ~IDataRanger() = default;

    virtual DataRange dataRange() const = 0;
};
