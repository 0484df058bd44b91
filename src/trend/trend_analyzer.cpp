/// @file src/trend/trend_analyzer.cpp
/// @brief Trend Analyzer.

#include "finrep/trend.hpp"
#include "finrep/constants.hpp"

#include "../core/checked_math.hpp"

namespace finrep {

TrendData TrendAnalyzer::analyze(Amount current_amount, Amount previous_amount) {
    const Amount change = core::checked_sub(current_amount, previous_amount,
                                            "trend change_amount");

    std::int32_t change_percentage = 0;
    if (previous_amount > 0) {
        change_percentage = core::saturate_i32(
            core::scaled_percent(change, previous_amount, "trend change_percentage"));
    } else if (current_amount > 0) {
        change_percentage = constants::TREND_FROM_ZERO_PERCENTAGE;
    }

    return TrendData{
        .current_amount    = current_amount,
        .previous_amount   = previous_amount,
        .change_amount     = change,
        .change_percentage = change_percentage,
    };
}

} // namespace finrep
