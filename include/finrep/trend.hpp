#pragma once

/// @file include/finrep/trend.hpp
/// @brief Trend Analyzer: stateless period-over-period comparison.

#include "finrep/reports.hpp"

namespace finrep {

class TrendAnalyzer {
public:
    TrendAnalyzer() = delete;

    /// Compare two amounts.
    ///
    /// # Formula
    ///   change = current − previous
    ///   pct    = change * 100 / previous   if previous > 0
    ///          = 100                       if previous <= 0 and current > 0
    ///          = 0                         otherwise
    ///
    /// A move up from zero always reports exactly +100 %. The percentage is
    /// truncated toward zero and saturated to the int32 range.
    ///
    /// # Throws
    /// `ReportingError{ArithmeticOverflow}` if `change` or `change * 100`
    /// does not fit in 128 bits.
    [[nodiscard]] static TrendData analyze(Amount current_amount,
                                           Amount previous_amount);
};

} // namespace finrep
