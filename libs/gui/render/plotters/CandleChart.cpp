#include "CandleChart.hpp"
#include "../../canvas/Canvas.hpp"
#include "../../plot/Plot.hpp"
#include "CandlewickLogging.hpp"
#include <utility>

CandleChart::CandleChart(CandleSeries series, CandleStyle style)
    : m_series(std::move(series)), m_style(std::move(style)) {
}

void CandleChart::plot(Canvas& canvas, const Plot& plot) const {
    render(canvas, plot.transforms(canvas));
}

void CandleChart::render(Canvas& canvas, const PlotTransform& tr) const {
    if (m_series.size() < 2) {
        cwLog_Render("CandleChart: need two candles to derive a width, skipping" << m_series.size());
        return;
    }

    const double width = tr.x(m_series[1].position()) - tr.x(m_series[0].position());
    const double half = width / 2.0;

    for (const auto& candle : m_series) {
        const double x = tr.x(candle.position());
        const double low = tr.y(candle.low());
        const double high = tr.y(candle.high());
        const double bodyBottom = tr.y(candle.bodyLow());
        const double bodyTop = tr.y(candle.bodyHigh());

        // Last point steps back by half the stroke so the closing corner has no seam
        QPolygonF body;
        body << QPointF(x - half, bodyBottom)
             << QPointF(x - half, bodyTop)
             << QPointF(x + half, bodyTop)
             << QPointF(x + half, bodyBottom)
             << QPointF(x - half - m_style.body.width / 2.0, bodyBottom);

        const QColor& fill = candle.isDown() ? m_style.downFill : m_style.upFill;
        canvas.fillPolygon(fill, canvas.clipPolygonY(body));
        canvas.strokeLines(m_style.body, canvas.clipLinesY({body}));

        // Zero-length caps keep the whisker tips when they sit on the boundary
        std::vector<QPolygonF> whiskers{
            QPolygonF{QPointF(x, bodyTop), QPointF(x, high)},
            QPolygonF{QPointF(x, high), QPointF(x, high)},
            QPolygonF{QPointF(x, bodyBottom), QPointF(x, low)},
            QPolygonF{QPointF(x, low), QPointF(x, low)}
        };
        canvas.strokeLines(m_style.whisker, canvas.clipLinesY(whiskers));
    }

    cwLog_Render("CandleChart rendered" << m_series.size() << "candles, width" << width);
}

DataRange CandleChart::dataRange() const {
    return DataRange{
        0.0,
        static_cast<double>(m_series.size()) * kRightMarginFactor,
        m_series.globalLow(),
        m_series.globalHigh()
    };
}
