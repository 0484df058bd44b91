/// @file src/core/data_loader.cpp
/// @brief CSV fixture loader for upstream records.

#include "finrep/data_loader.hpp"

#include <fmt/core.h>

#include <charconv>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace finrep::core {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Unsigned magnitude of the most negative `Amount` (2^127).
constexpr unsigned __int128 AMOUNT_MIN_MAGNITUDE = static_cast<unsigned __int128>(1) << 127;

template <typename T>
std::optional<T> parse_unsigned(const std::string& token) noexcept {
    T value{};
    const char* first = token.data();
    const char* last  = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || token.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_bool(const std::string& token) noexcept {
    if (token == "1" || token == "true")  return true;
    if (token == "0" || token == "false") return false;
    return std::nullopt;
}

/// Iterate the data rows of a CSV document: the first non-empty,
/// non-comment line is the header and is skipped. Calls `on_row` with the
/// split fields of every later non-empty, non-comment line. Returns the
/// number of rows `on_row` rejected.
template <typename OnRow>
std::size_t for_each_row(const std::string& csv_content, OnRow&& on_row) {
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        if (!on_row(DataLoader::split_fields(line))) {
            ++skipped;
        }
    }
    return skipped;
}

void warn_skipped(const char* what, std::size_t skipped) {
    if (skipped > 0) {
        fmt::print(stderr, "[data_loader] Skipped {} malformed {} row(s)\n", skipped, what);
    }
}

} // anonymous namespace

// ─── DataLoader::split_fields ─────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        fields.push_back(first == std::string::npos
                             ? std::string{}
                             : token.substr(first, last - first + 1));
    }
    // A trailing comma means a trailing empty field.
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

// ─── DataLoader::parse_amount ─────────────────────────────────────────────────

std::optional<Amount> DataLoader::parse_amount(std::string_view token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    std::size_t i = 0;
    if (token[0] == '-' || token[0] == '+') {
        negative = token[0] == '-';
        i = 1;
    }
    if (i == token.size()) {
        return std::nullopt;
    }

    const unsigned __int128 limit =
        negative ? AMOUNT_MIN_MAGNITUDE : AMOUNT_MIN_MAGNITUDE - 1;
    unsigned __int128 magnitude = 0;
    for (; i < token.size(); ++i) {
        const char c = token[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const unsigned digit = static_cast<unsigned>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            return std::nullopt;
        }
        magnitude = magnitude * 10 + digit;
    }

    if (negative) {
        // Two's complement negation of the magnitude; well defined for 2^127.
        return static_cast<Amount>(~magnitude + 1);
    }
    return static_cast<Amount>(magnitude);
}

// ─── DataLoader::parse_goals_csv ──────────────────────────────────────────────

std::vector<SavingsGoal>
DataLoader::parse_goals_csv(const std::string& csv_content) noexcept {
    std::vector<SavingsGoal> goals;
    try {
        const auto skipped = for_each_row(csv_content, [&](const std::vector<std::string>& f) {
            if (f.size() != 7) return false;
            const auto id      = parse_unsigned<std::uint32_t>(f[0]);
            const auto target  = parse_amount(f[3]);
            const auto current = parse_amount(f[4]);
            const auto date    = parse_unsigned<Timestamp>(f[5]);
            const auto locked  = parse_bool(f[6]);
            if (!id || f[1].empty() || !target || !current || !date || !locked) {
                return false;
            }
            goals.push_back(SavingsGoal{
                .id             = *id,
                .owner          = Identity{f[1]},
                .name           = f[2],
                .target_amount  = *target,
                .current_amount = *current,
                .target_date    = *date,
                .locked         = *locked,
            });
            return true;
        });
        warn_skipped("goal", skipped);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[data_loader] goal parse aborted: {}\n", ex.what());
    }
    return goals;
}

// ─── DataLoader::parse_bills_csv ──────────────────────────────────────────────

std::vector<Bill>
DataLoader::parse_bills_csv(const std::string& csv_content) noexcept {
    std::vector<Bill> bills;
    try {
        const auto skipped = for_each_row(csv_content, [&](const std::vector<std::string>& f) {
            if (f.size() != 10) return false;
            const auto id        = parse_unsigned<std::uint32_t>(f[0]);
            const auto amount    = parse_amount(f[3]);
            const auto due       = parse_unsigned<Timestamp>(f[4]);
            const auto recurring = parse_bool(f[5]);
            const auto freq      = parse_unsigned<std::uint32_t>(f[6]);
            const auto paid      = parse_bool(f[7]);
            const auto created   = parse_unsigned<Timestamp>(f[8]);
            if (!id || f[1].empty() || !amount || !due || !recurring || !freq ||
                !paid || !created) {
                return false;
            }
            std::optional<Timestamp> paid_at;
            if (!f[9].empty()) {
                paid_at = parse_unsigned<Timestamp>(f[9]);
                if (!paid_at) return false;
            }
            bills.push_back(Bill{
                .id             = *id,
                .owner          = Identity{f[1]},
                .name           = f[2],
                .amount         = *amount,
                .due_date       = *due,
                .recurring      = *recurring,
                .frequency_days = *freq,
                .paid           = *paid,
                .created_at     = *created,
                .paid_at        = paid_at,
            });
            return true;
        });
        warn_skipped("bill", skipped);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[data_loader] bill parse aborted: {}\n", ex.what());
    }
    return bills;
}

// ─── DataLoader::parse_policies_csv ───────────────────────────────────────────

std::vector<InsurancePolicy>
DataLoader::parse_policies_csv(const std::string& csv_content) noexcept {
    std::vector<InsurancePolicy> policies;
    try {
        const auto skipped = for_each_row(csv_content, [&](const std::vector<std::string>& f) {
            if (f.size() != 8) return false;
            const auto id       = parse_unsigned<std::uint32_t>(f[0]);
            const auto premium  = parse_amount(f[4]);
            const auto coverage = parse_amount(f[5]);
            const auto active   = parse_bool(f[6]);
            const auto next     = parse_unsigned<Timestamp>(f[7]);
            if (!id || f[1].empty() || !premium || !coverage || !active || !next) {
                return false;
            }
            policies.push_back(InsurancePolicy{
                .id                = *id,
                .owner             = Identity{f[1]},
                .name              = f[2],
                .coverage_type     = f[3],
                .monthly_premium   = *premium,
                .coverage_amount   = *coverage,
                .active            = *active,
                .next_payment_date = *next,
            });
            return true;
        });
        warn_skipped("policy", skipped);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[data_loader] policy parse aborted: {}\n", ex.what());
    }
    return policies;
}

// ─── DataLoader::parse_split_csv ──────────────────────────────────────────────

std::vector<std::uint32_t>
DataLoader::parse_split_csv(const std::string& csv_content) noexcept {
    std::vector<std::uint32_t> split;
    try {
        const auto skipped = for_each_row(csv_content, [&](const std::vector<std::string>& f) {
            if (f.size() != 1) return false;
            const auto pct = parse_unsigned<std::uint32_t>(f[0]);
            if (!pct) return false;
            split.push_back(*pct);
            return true;
        });
        warn_skipped("split", skipped);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[data_loader] split parse aborted: {}\n", ex.what());
    }
    return split;
}

// ─── DataLoader::read_file ────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) noexcept {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[data_loader] cannot read '{}': {}\n", filepath, ex.what());
        return std::nullopt;
    }
}

} // namespace finrep::core
