#include "Candle.hpp"
#include "Errors.hpp"
#include <algorithm>

Candle Candle::aggregate(double position, const std::vector<double>& samples) {
    if (samples.empty()) {
        throw candlewick::EmptyInputError("Candle: period has no samples, need at least one");
    }

    double low = samples.front();
    double high = samples.front();
    for (double s : samples) {
        low = std::min(low, s);
        high = std::max(high, s);
    }

    return Candle(position, samples.front(), samples.back(), low, high);
}
