#include "DefaultTicks.hpp"
#include <algorithm>
#include <cmath>

std::vector<Tick> DefaultTicks::ticks(double min, double max) const {
    std::vector<Tick> out;
    if (!std::isfinite(min) || !std::isfinite(max) || max <= min) return out;

    const double step = niceStep(max - min, std::max(1, m_targetTicks));
    const int decimals = std::max(1, decimalPlaces(step));
    const double tolerance = step * 1e-9;

    // Find first major tick at or above min
    const double first = std::ceil((min - tolerance) / step) * step;

    for (int i = 0;; ++i) {
        double value = first + i * step;
        if (value > max + tolerance) break;
        if (std::abs(value) < tolerance) value = 0.0;  // avoid "-0.0"

        out.push_back({value, QString::number(value, 'f', decimals)});

        const double minor = value + step / 2.0;
        if (minor <= max + tolerance) {
            out.push_back({minor, QString()});
        }
    }

    // Leading minor tick below the first major
    const double leading = first - step / 2.0;
    if (leading >= min - tolerance) {
        out.insert(out.begin(), Tick{leading, QString()});
    }

    return out;
}

double DefaultTicks::niceStep(double range, int targetTicks) {
    if (range <= 0 || targetTicks <= 0) return 1.0;

    double rawStep = range / targetTicks;
    double magnitude = std::pow(10.0, std::floor(std::log10(rawStep)));
    double normalizedStep = rawStep / magnitude;

    // Choose nice step sizes
    double niceStep;
    if (normalizedStep <= 1.0) {
        niceStep = 1.0;
    } else if (normalizedStep <= 2.0) {
        niceStep = 2.0;
    } else if (normalizedStep <= 5.0) {
        niceStep = 5.0;
    } else {
        niceStep = 10.0;
    }

    return niceStep * magnitude;
}

int DefaultTicks::decimalPlaces(double step) {
    if (step <= 0.0 || step >= 1.0) return 0;
    return static_cast<int>(std::ceil(-std::log10(step) - 1e-9));
}
