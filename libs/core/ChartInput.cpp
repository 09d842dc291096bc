#include "ChartInput.hpp"
#include "CandlewickLogging.hpp"
#include "Errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

ChartInput ChartInput::fromJson(const std::string& text) {
    auto doc = nlohmann::json::parse(text);
    if (!doc.is_object()) {
        throw candlewick::ChartInputError("ChartInput: document must be a JSON object");
    }
    if (!doc.contains("periods") || !doc["periods"].is_array()) {
        throw candlewick::ChartInputError("ChartInput: missing \"periods\" array");
    }

    ChartInput input;
    for (const auto& period : doc["periods"]) {
        if (!period.is_array()) {
            throw candlewick::ChartInputError("ChartInput: each period must be an array of prices");
        }
        std::vector<double> samples;
        samples.reserve(period.size());
        for (const auto& s : period) {
            if (!s.is_number()) {
                throw candlewick::ChartInputError("ChartInput: non-numeric price sample " + s.dump());
            }
            samples.push_back(s.get<double>());
        }
        input.periods.push_back(std::move(samples));
    }

    if (doc.contains("bar_unit")) {
        const auto& bu = doc["bar_unit"];
        if (!bu.is_object()) {
            throw candlewick::ChartInputError("ChartInput: \"bar_unit\" must be an object");
        }
        if (bu.contains("count")) {
            if (!bu["count"].is_number_integer()) {
                throw candlewick::ChartInputError("ChartInput: \"bar_unit.count\" must be an integer, got " + bu["count"].dump());
            }
            input.barUnit.count = bu["count"].get<int>();
        }
        if (bu.contains("unit")) {
            if (!bu["unit"].is_string()) {
                throw candlewick::ChartInputError("ChartInput: \"bar_unit.unit\" must be a string, got " + bu["unit"].dump());
            }
            input.barUnit.unit = bu["unit"].get<std::string>();
        }
    }

    if (doc.contains("labels")) {
        if (!doc["labels"].is_array()) {
            throw candlewick::ChartInputError("ChartInput: \"labels\" must be an array");
        }
        for (const auto& label : doc["labels"]) {
            input.labels.push_back(label.is_string() ? label.get<std::string>() : label.dump());
        }
        if (input.labels.size() != input.periods.size()) {
            throw candlewick::ChartInputError("ChartInput: " + std::to_string(input.labels.size())
                + " labels for " + std::to_string(input.periods.size()) + " periods");
        }
    } else {
        for (size_t i = 0; i < input.periods.size(); ++i) {
            input.labels.push_back(std::to_string(i));
        }
    }

    cwLog_Data("ChartInput parsed:" << input.periods.size() << "periods, bar unit"
               << input.barUnit.count << QString::fromStdString(input.barUnit.unit));
    return input;
}

ChartInput ChartInput::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw candlewick::ChartInputError("ChartInput: cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromJson(buffer.str());
}
