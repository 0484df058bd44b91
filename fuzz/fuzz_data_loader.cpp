/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV fixture loader and amount parser.
 *
 * Build:
 *   cmake -DFINREP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Every parsed bill has a non-empty owner.
 *   3. parse_amount either rejects the token or round-trips it through
 *      fmt's 128-bit formatting (modulo a leading '+' and leading zeros).
 *   4. The reducers accept whatever the loader produced: percentages stay
 *      bounded, and overflow surfaces as ArithmeticOverflow, never a wrap.
 *
 * Fuzzer strategy:
 *   The input is used verbatim as every CSV document, so one corpus entry
 *   exercises the goal, bill, policy and split row shapes at once.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "finrep/bills.hpp"
#include "finrep/data_loader.hpp"
#include "finrep/error.hpp"
#include "finrep/savings.hpp"

using namespace finrep;
using namespace finrep::core;

namespace {

/// Canonical decimal form: no '+', no leading zeros, "-0" → "0".
std::string canonical(std::string_view token) {
    bool negative = false;
    if (!token.empty() && (token[0] == '+' || token[0] == '-')) {
        negative = token[0] == '-';
        token.remove_prefix(1);
    }
    while (token.size() > 1 && token[0] == '0') token.remove_prefix(1);
    if (token == "0") negative = false;
    return (negative ? "-" : "") + std::string(token);
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    // Invariant 1 and 2: loaders never throw, produce well-formed records.
    const auto goals    = DataLoader::parse_goals_csv(input);
    const auto bills    = DataLoader::parse_bills_csv(input);
    const auto policies = DataLoader::parse_policies_csv(input);
    const auto split    = DataLoader::parse_split_csv(input);
    (void)policies;
    (void)split;

    for (const auto& b : bills) {
        assert(!b.owner.value.empty());
    }

    // Invariant 3: amount parser agrees with the formatter.
    if (size <= 64) {
        const std::string_view token{input};
        if (const auto amount = DataLoader::parse_amount(token)) {
            assert(fmt::format("{}", *amount) == canonical(token));
        }
    }

    // Invariant 4: reducers accept whatever the loader produced. Overflow is
    // reported as an error, never as a wrapped value.
    try {
        const auto sr = SavingsProgressCalculator::reduce(goals, 0, 0);
        assert(sr.completion_percentage <= 100u);
        assert(sr.total_goals == goals.size());

        if (!bills.empty()) {
            const auto br = BillComplianceCalculator::reduce(
                bills, bills.front().owner, 0, UINT64_MAX, 0);
            assert(br.paid_bills + br.unpaid_bills == br.total_bills);
            assert(br.compliance_percentage <= 100u);
        }
    } catch (const ReportingError& ex) {
        assert(ex.kind() == ErrorKind::ArithmeticOverflow);
    }

    return 0;
}
