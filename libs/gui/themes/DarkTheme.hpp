#pragma once

#include "IChartTheme.hpp"

/**
 * Dark theme for Candlewick charts.
 * Up candles are hollow (background colored), down candles solid light grey.
 */
class DarkTheme : public IChartTheme {
public:
    QString name() const override { return "Dark"; }
    QString id() const override { return "dark"; }
    QString description() const override { return "Dark background optimized for screens"; }

    QColor background() const override { return QColor("#1E1E1E"); }
    QColor foreground() const override { return QColor("#E8E8E8"); }

    CandleStyle candleStyle() const override;
    LineStyle lineStyle() const override { return LineStyle{QColor("#00AAFF"), 1.5}; }
    GlyphStyle glyphStyle() const override { return GlyphStyle{QColor("#00AAFF"), 2.5}; }
};
