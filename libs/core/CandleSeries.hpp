/*
Candlewick: CandleSeries
Role: Ordered candles for a chart plus the global price extremes used for axis scaling.
Inputs/Outputs: Built from per-period sample arrays; period i is placed at position i.
Threading: Immutable after build; share read-only.
Related: CandleSeries.cpp, Candle.hpp, CandleChart.hpp.
*/
#pragma once
#include "Candle.hpp"
#include <cstddef>
#include <vector>

class CandleSeries {
public:
    /**
     * Aggregate each period in order. Throws candlewick::EmptyInputError if
     * periods is empty or any period has no samples; no partial series is kept.
     */
    static CandleSeries build(const std::vector<std::vector<double>>& periods);

    const std::vector<Candle>& candles() const { return m_candles; }
    const Candle& operator[](size_t index) const { return m_candles[index]; }
    size_t size() const { return m_candles.size(); }
    bool empty() const { return m_candles.empty(); }

    double globalLow() const { return m_globalLow; }
    double globalHigh() const { return m_globalHigh; }

    auto begin() const { return m_candles.begin(); }
    auto end() const { return m_candles.end(); }

private:
    explicit CandleSeries(std::vector<Candle> candles);

    std::vector<Candle> m_candles;
    double m_globalLow = 0.0;
    double m_globalHigh = 0.0;
};
