/*
Candlewick: CandleChart
Role: Plotter that draws a CandleSeries as filled candle bodies with high/low whiskers.
Inputs/Outputs: Owns the series; turns it into fill/stroke calls on a Canvas through a PlotTransform.
Threading: render() is const and touches only the canvas; one render pass per canvas at a time.
Performance: One fill and two stroke calls per candle.
Integration: Added to a Plot; also reports its DataRange for axis autoscaling.
Observability: Logs skipped renders to the render category.
Related: CandleChart.cpp, CandleSeries.hpp, Canvas.hpp, IPlotter.hpp.
Assumptions: Candles are uniformly spaced; the body width is taken from the first two positions only.
*/
#pragma once
#include "../IPlotter.hpp"
#include "../../canvas/DrawStyles.hpp"
#include "../../CoordinateSystem.h"
#include "CandleSeries.hpp"

class CandleChart : public IPlotter, public IDataRanger {
public:
    // Right-hand padding of the X range, as a multiple of the candle count
    static constexpr double kRightMarginFactor = 1.3;

    explicit CandleChart(CandleSeries series, CandleStyle style = CandleStyle{});
    ~CandleChart() override = default;

    void plot(Canvas& canvas, const Plot& plot) const override;
    const char* getPlotterName() const override { return "CandleChart"; }
    DataRange dataRange() const override;

    /**
     * Draw every candle with the given transform. Per candle: fill the body,
     * stroke the body outline, then stroke the whiskers on top. Series with
     * fewer than two candles draw nothing.
     */
    void render(Canvas& canvas, const PlotTransform& transform) const;

    const CandleSeries& series() const { return m_series; }
    const CandleStyle& style() const { return m_style; }

private:
    CandleSeries m_series;
    CandleStyle m_style;
};
