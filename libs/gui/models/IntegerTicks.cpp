#include "IntegerTicks.hpp"
#include "DefaultTicks.hpp"
#include "CandlewickLogging.hpp"
#include <cmath>

IntegerTicks::IntegerTicks()
    : m_source(std::make_shared<DefaultTicks>()) {
}

IntegerTicks::IntegerTicks(std::shared_ptr<const ITickMarker> source)
    : m_source(source ? std::move(source) : std::make_shared<DefaultTicks>()) {
}

std::vector<Tick> IntegerTicks::ticks(double min, double max) const {
    std::vector<Tick> ticks = m_source->ticks(min, max);
    for (auto& tick : ticks) {
        if (tick.isMinor()) continue;  // Minor ticks are fine as they are

        bool ok = false;
        double value = tick.label.toDouble(&ok);
        if (!ok) {
            cwLog_Warning("IntegerTicks: keeping non-numeric tick label" << tick.label);
            continue;
        }
        // Halves go to the even neighbour, as the default rounding mode does
        tick.label = QString::number(std::nearbyint(value), 'f', 0);
    }
    return ticks;
}
