#pragma once

#include <QColor>
#include <QString>
#include "../canvas/DrawStyles.hpp"

/**
 * Interface for chart style presets.
 * Each theme provides a name and the colors/styles plotters are built with.
 */
class IChartTheme {
public:
    virtual ~IChartTheme() = default;
    
    /**
     * Get the display name of this theme.
     */
    virtual QString name() const = 0;
    
    /**
     * Get the unique identifier for this theme.
     */
    virtual QString id() const = 0;
    
    /**
     * Optional: Get a description of the theme.
     */
    virtual QString description() const { return QString(); }

    // Plot surface
    virtual QColor background() const = 0;
    virtual QColor foreground() const = 0;

    // Plotter styles
    virtual CandleStyle candleStyle() const = 0;
    virtual LineStyle lineStyle() const = 0;
    virtual GlyphStyle glyphStyle() const = 0;
};
