#pragma once
#include <string>
#include <vector>
#include "BarUnit.hpp"

/**
 * ChartInput - candle chart input document.
 *
 *   {
 *     "labels":   ["09:00", "09:05"],
 *     "bar_unit": {"count": 5, "unit": "minute"},
 *     "periods":  [[10, 12, 9, 11], [11, 10, 13, 9]]
 *   }
 *
 * "labels" and "bar_unit" are optional. Sample emptiness is not checked here;
 * CandleSeries::build reports it.
 */
struct ChartInput {
    std::vector<std::string> labels;
    BarUnit barUnit;
    std::vector<std::vector<double>> periods;

    // Throws candlewick::ChartInputError on malformed structure and
    // nlohmann::json::parse_error on malformed JSON text.
    static ChartInput fromJson(const std::string& text);
    static ChartInput fromFile(const std::string& path);
};
