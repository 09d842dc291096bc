#include "DarkTheme.hpp"

CandleStyle DarkTheme::candleStyle() const {
    CandleStyle style;
    style.upFill = background();
    style.downFill = QColor("#C0C0C0");
    style.body = LineStyle{QColor("#E8E8E8"), 1.0};
    style.whisker = LineStyle{QColor("#C0C0C0"), 1.0};
    return style;
}
