#include "ClassicTheme.hpp"

CandleStyle ClassicTheme::candleStyle() const {
    CandleStyle style;
    style.upFill = Qt::white;
    style.downFill = Qt::black;
    style.body = LineStyle{Qt::black, 1.0};
    style.whisker = LineStyle{Qt::black, 1.0};
    return style;
}
