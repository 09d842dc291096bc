#pragma once
#include "TickMarker.hpp"
#include <memory>

/**
 * IntegerTicks - price axis ticks labeled as whole numbers.
 *
 * Takes the positions and labels of another tick marker (DefaultTicks unless
 * one is injected) and rewrites every labeled tick to zero decimal places,
 * e.g. "1250.0" becomes "1250". Exact halves round to
 * the even integer ("2.5" becomes "2"). Minor ticks are passed through unchanged. A
 * label that does not parse as a number is also left unchanged and reported
 * as a warning.
 */
class IntegerTicks : public ITickMarker {
public:
    IntegerTicks();
    explicit IntegerTicks(std::shared_ptr<const ITickMarker> source);

    std::vector<Tick> ticks(double min, double max) const override;

private:
    std::shared_ptr<const ITickMarker> m_source;
};
