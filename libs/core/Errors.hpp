#pragma once
#include <stdexcept>
#include <string>

namespace candlewick {

/// A period's sample array (or the list of periods) was empty.
class EmptyInputError : public std::invalid_argument {
public:
    explicit EmptyInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Paired x/y sequences handed to a plot helper differ in length.
class LengthMismatchError : public std::invalid_argument {
public:
    explicit LengthMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// The chart input document is structurally invalid.
class ChartInputError : public std::runtime_error {
public:
    explicit ChartInputError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace candlewick
