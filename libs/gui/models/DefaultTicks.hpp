#pragma once
#include "TickMarker.hpp"

/**
 * DefaultTicks - "nice" tick marks for a numeric axis.
 *
 * Major ticks are placed on multiples of 1, 2, 5 or 10 x 10^k so that roughly
 * targetTicks of them cover the range, and are labeled with the step's decimal
 * places (at least one, e.g. "12.0", "12.5"). Unlabeled minor ticks sit
 * halfway between majors.
 */
class DefaultTicks : public ITickMarker {
public:
    explicit DefaultTicks(int targetTicks = 5) : m_targetTicks(targetTicks) {}

    std::vector<Tick> ticks(double min, double max) const override;

    static double niceStep(double range, int targetTicks);
    static int decimalPlaces(double step);

private:
    int m_targetTicks;
};
