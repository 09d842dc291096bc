#pragma once
#include <QString>
#include <utility>
#include <vector>

/**
 * Tick - one axis mark at a data-space value.
 * An empty label marks a minor tick.
 */
struct Tick {
    double value = 0.0;
    QString label;

    bool isMinor() const { return label.isEmpty(); }
};

/**
 * ITickMarker - source of axis ticks for a data range.
 * Implementations return ticks ordered by value.
 */
class ITickMarker {
public:
    virtual ~ITickMarker() = default;

    virtual std::vector<Tick> ticks(double min, double max) const = 0;
};

/**
 * ConstantTicks - always returns the same ticks regardless of the range.
 * Used for nominal (categorical) axes.
 */
class ConstantTicks : public ITickMarker {
public:
    explicit ConstantTicks(std::vector<Tick> ticks) : m_ticks(std::move(ticks)) {}

    std::vector<Tick> ticks(double, double) const override { return m_ticks; }

private:
    std::vector<Tick> m_ticks;
};
