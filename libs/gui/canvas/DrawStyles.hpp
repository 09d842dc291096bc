#pragma once
#include <QColor>
#include <QtGlobal>

// Stroke style for outlines, whiskers and polylines (width in device pixels)
struct LineStyle {
    QColor color = Qt::black;
    qreal width = 1.0;
};

// Marker style for scatter points
struct GlyphStyle {
    QColor color = Qt::black;
    qreal radius = 2.5;
};

// Candle presentation: down candles are filled solid/dark, up candles hollow/light
struct CandleStyle {
    QColor upFill = Qt::white;
    QColor downFill = Qt::black;
    LineStyle body{Qt::black, 1.0};
    LineStyle whisker{Qt::black, 1.0};
};
