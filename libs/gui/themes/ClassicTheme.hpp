#pragma once

#include "IChartTheme.hpp"

/**
 * Classic print-style theme: white paper, black ink, hollow up candles and
 * solid down candles.
 */
class ClassicTheme : public IChartTheme {
public:
    QString name() const override { return "Classic"; }
    QString id() const override { return "classic"; }
    QString description() const override { return "Black on white, suitable for print"; }

    QColor background() const override { return Qt::white; }
    QColor foreground() const override { return Qt::black; }

    CandleStyle candleStyle() const override;
    LineStyle lineStyle() const override { return LineStyle{Qt::black, 1.0}; }
    GlyphStyle glyphStyle() const override { return GlyphStyle{Qt::black, 2.5}; }
};
