#include "CandleSeries.hpp"
#include "CandlewickLogging.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <string>
#include <utility>

CandleSeries CandleSeries::build(const std::vector<std::vector<double>>& periods) {
    if (periods.empty()) {
        throw candlewick::EmptyInputError("CandleSeries: no periods supplied");
    }

    std::vector<Candle> candles;
    candles.reserve(periods.size());
    for (size_t i = 0; i < periods.size(); ++i) {
        if (periods[i].empty()) {
            throw candlewick::EmptyInputError("CandleSeries: period " + std::to_string(i) + " has no samples");
        }
        candles.push_back(Candle::aggregate(static_cast<double>(i), periods[i]));
    }

    return CandleSeries(std::move(candles));
}

CandleSeries::CandleSeries(std::vector<Candle> candles)
    : m_candles(std::move(candles)) {
    m_globalLow = m_candles.front().low();
    m_globalHigh = m_candles.front().high();
    for (const auto& c : m_candles) {
        m_globalLow = std::min(m_globalLow, c.low());
        m_globalHigh = std::max(m_globalHigh, c.high());
    }

    cwLog_Data("CandleSeries built:" << m_candles.size() << "candles, range"
               << m_globalLow << "-" << m_globalHigh);
}
