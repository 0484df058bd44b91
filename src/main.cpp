/// @file src/main.cpp
/// @brief finrep CLI entry point.
///
/// Usage:
///   finrep --report <dir> --owner <id> [options]   Build a financial health report
///   finrep --trend <current> <previous>            Compare two amounts
///   finrep --help                                  Print usage

#include "finrep/data_loader.hpp"
#include "finrep/engine.hpp"
#include "finrep/error.hpp"
#include "finrep/in_memory.hpp"
#include "finrep/trend.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  finrep --report <dir> --owner <id> [options]   Build a financial health report\n"
        "  finrep --trend <current> <previous>            Compare two amounts\n"
        "  finrep --help                                  Show this help\n"
        "\n"
        "Report options:\n"
        "  --total <amount>      Remittance total for the period (default 0)\n"
        "  --previous <amount>   Previous period total; prints the trend against --total\n"
        "  --start <ts>          Period start, inclusive (default 0)\n"
        "  --end <ts>            Period end, inclusive (default max)\n"
        "  --now <ts>            Ledger time used for overdue checks and the report\n"
        "                        timestamp (default --end; required without --end)\n"
        "  --store <period_key>  Store the report under this key after generation\n"
        "  --verbose             Trace engine operations to stderr\n"
        "\n"
        "<dir> holds goals.csv, bills.csv, policies.csv and split.csv; missing\n"
        "files are treated as empty.\n"
    );
}

struct ReportArgs {
    std::string                   dir;
    std::string                   owner;
    finrep::Amount                total = 0;
    std::optional<finrep::Amount> previous;
    finrep::Timestamp             start = 0;
    std::optional<finrep::Timestamp> end;
    std::optional<finrep::Timestamp> now;
    std::optional<finrep::PeriodKey> store_key;
    bool                          verbose = false;
};

std::optional<finrep::Timestamp> parse_u64(const std::string& s) {
    const auto v = finrep::core::DataLoader::parse_amount(s);
    if (!v || *v < 0 || *v > static_cast<finrep::Amount>(UINT64_MAX)) {
        return std::nullopt;
    }
    return static_cast<finrep::Timestamp>(*v);
}

/// Returns nullopt (after printing the reason) on any malformed argument.
std::optional<ReportArgs> parse_report_args(int argc, char* argv[]) {
    ReportArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);
        const bool has_value = i + 1 < argc;

        if (flag == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (!has_value) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (flag == "--report") {
            args.dir = value;
        } else if (flag == "--owner") {
            args.owner = value;
        } else if (flag == "--total" || flag == "--previous") {
            const auto v = finrep::core::DataLoader::parse_amount(value);
            if (!v) {
                fmt::print(stderr, "Error: invalid amount '{}'\n", value);
                return std::nullopt;
            }
            if (flag == "--total") args.total = *v;
            else                   args.previous = *v;
        } else if (flag == "--start" || flag == "--end" || flag == "--now" ||
                   flag == "--store") {
            const auto v = parse_u64(value);
            if (!v) {
                fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, flag);
                return std::nullopt;
            }
            if (flag == "--start")      args.start = *v;
            else if (flag == "--end")   args.end = *v;
            else if (flag == "--now")   args.now = *v;
            else                        args.store_key = *v;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }

    if (args.dir.empty() || args.owner.empty()) {
        fmt::print(stderr, "Error: --report and --owner are required\n");
        return std::nullopt;
    }
    // An open-ended period has no ledger time to stand in for "now".
    if (!args.now && !args.end) {
        fmt::print(stderr, "Error: --now is required when --end is not given\n");
        return std::nullopt;
    }
    return args;
}

/// Load `<dir>/<name>`; a missing file is an empty document.
std::string load_fixture(const std::string& dir, const char* name) {
    const std::string path = dir + "/" + name;
    auto contents = finrep::core::DataLoader::read_file(path);
    if (!contents) {
        fmt::print(stderr, "Warning: '{}' not found, treating as empty\n", path);
        return {};
    }
    return *contents;
}

/// Build an in-memory world from CSV fixtures and run one report.
/// Returns 0 on success, 1 on error.
int run_report(const ReportArgs& args) {
    using namespace finrep;
    namespace fr = finrep::core;

    InMemoryRemittanceSplit split(
        fr::DataLoader::parse_split_csv(load_fixture(args.dir, "split.csv")));
    InMemorySavingsGoals goals(
        fr::DataLoader::parse_goals_csv(load_fixture(args.dir, "goals.csv")));
    InMemoryBillPayments bills(
        fr::DataLoader::parse_bills_csv(load_fixture(args.dir, "bills.csv")));
    InMemoryInsurance insurance(
        fr::DataLoader::parse_policies_csv(load_fixture(args.dir, "policies.csv")));

    const Identity admin{"local-admin"};
    const Identity owner{args.owner};
    const CollaboratorAddresses addresses{
        .remittance_split = Identity{"local:split"},
        .savings_goals    = Identity{"local:goals"},
        .bill_payments    = Identity{"local:bills"},
        .insurance        = Identity{"local:insurance"},
        .family_wallet    = Identity{"local:family"},
    };

    StaticDirectory directory;
    directory.bind(addresses.remittance_split, split);
    directory.bind(addresses.savings_goals, goals);
    directory.bind(addresses.bill_payments, bills);
    directory.bind(addresses.insurance, insurance);

    ReportingState      state;
    InMemoryReportStore store;
    FixedClock          clock(args.now ? *args.now : *args.end);
    AllowListAuthorizer auth{admin, owner};
    EventLog            events;

    fr::ReportingEngine engine(
        fr::ReportingContext{state, store, directory, clock, auth, events},
        EngineConfig{.verbose = args.verbose});

    try {
        engine.init(admin);
        engine.configure_addresses(admin, addresses);

        const auto report = engine.get_financial_health_report(
            owner, args.total, args.start, args.end.value_or(UINT64_MAX));
        fmt::print("{}", report.to_string());

        if (args.previous) {
            const auto trend = engine.get_trend_analysis(owner, args.total, *args.previous);
            fmt::print("{}\n", trend.to_string());
        }

        if (args.store_key) {
            engine.store_report(owner, report, *args.store_key);
            fmt::print("Stored under period key {}\n", *args.store_key);
        }
    } catch (const ReportingError& ex) {
        fmt::print(stderr, "Error [{}]: {}\n", to_string(ex.kind()), ex.what());
        return 1;
    }

    if (args.verbose) {
        for (const auto& event : events.events()) {
            fmt::print(stderr, "[finrep] event {}\n", event.to_string());
        }
    }
    return 0;
}

int run_trend(const std::string& current, const std::string& previous) {
    const auto cur  = finrep::core::DataLoader::parse_amount(current);
    const auto prev = finrep::core::DataLoader::parse_amount(previous);
    if (!cur || !prev) {
        fmt::print(stderr, "Error: amounts must be decimal integers\n");
        return 1;
    }
    try {
        fmt::print("{}\n", finrep::TrendAnalyzer::analyze(*cur, *prev).to_string());
    } catch (const finrep::ReportingError& ex) {
        fmt::print(stderr, "Error [{}]: {}\n", finrep::to_string(ex.kind()), ex.what());
        return 1;
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--trend") {
        if (argc != 4) {
            fmt::print(stderr, "Error: --trend requires <current> <previous>\n");
            print_usage();
            return 1;
        }
        return run_trend(argv[2], argv[3]);
    }

    if (mode == "--report") {
        const auto args = parse_report_args(argc, argv);
        if (!args) {
            print_usage();
            return 1;
        }
        return run_report(*args);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
