/*
Candlewick: Candle
Role: Summary of one period's price samples (open, close, low, high) placed at a position on the time axis.
Inputs/Outputs: Built from a non-empty sample sequence; immutable afterwards.
Threading: Plain value type; safe to share read-only across threads.
Related: Candle.cpp, CandleSeries.hpp, CandleChart.hpp.
Assumptions: Samples are in time order; the first is the open and the last is the close.
*/
#pragma once
#include <vector>

enum class CandleDirection {
    Up,     // open <= close, drawn hollow/light
    Down    // open > close, drawn solid/dark
};

class Candle {
public:
    /**
     * Reduce one period's samples into a candle at the given axis position.
     * Throws candlewick::EmptyInputError when samples is empty.
     */
    static Candle aggregate(double position, const std::vector<double>& samples);

    double position() const { return m_position; }
    double open() const { return m_open; }
    double close() const { return m_close; }
    double low() const { return m_low; }
    double high() const { return m_high; }

    CandleDirection direction() const {
        return m_open > m_close ? CandleDirection::Down : CandleDirection::Up;
    }
    bool isDown() const { return direction() == CandleDirection::Down; }

    // Body extent with orientation normalized: bodyLow() <= bodyHigh()
    double bodyLow() const { return m_open < m_close ? m_open : m_close; }
    double bodyHigh() const { return m_open < m_close ? m_close : m_open; }

private:
    Candle(double position, double open, double close, double low, double high)
        : m_position(position), m_open(open), m_close(close), m_low(low), m_high(high) {}

    double m_position = 0.0;
    double m_open = 0.0;
    double m_close = 0.0;
    double m_low = 0.0;
    double m_high = 0.0;
};
