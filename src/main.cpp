/// @file src/main.cpp
/// @brief fibscan CLI entry point.
///
/// Usage:
///   fibscan --scan <csv_file> [options]   Scan a price CSV for harmonic patterns
///   fibscan --stream [options]            Rescan as CSV rows arrive on stdin
///   fibscan --templates                   List the pattern template registry
///   fibscan --help                        Print usage

#include "fibscan/data_loader.hpp"
#include "fibscan/engine.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  fibscan --scan <csv_file> [options]   Scan price CSV for harmonic patterns\n"
        "  fibscan --stream [options]            Rescan as CSV rows arrive on stdin\n"
        "  fibscan --templates                   List pattern templates\n"
        "  fibscan --help                        Show this help\n"
        "\n"
        "Options:\n"
        "  --type all|complete|potential   Subset of patterns to report (default all)\n"
        "  --max-pivots N                  Most recent pivots to enumerate (default {})\n"
        "  --tolerance F                   Fibonacci tolerance fraction (default {})\n"
        "  --verbose                       Per-template diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,price   or   timestamp,open,high,low,close,volume\n",
        fibscan::constants::MAX_SCAN_PIVOTS,
        fibscan::constants::FIBONACCI_TOLERANCE);
}

struct CliOptions {
    fibscan::core::EngineConfig engine{};
    fibscan::ScanType           scan_type = fibscan::ScanType::All;
};

/// Parse options from argv[first..]. Returns `nullopt` after reporting an error.
std::optional<CliOptions> parse_options(int argc, char* argv[], int first) {
    CliOptions opts;
    for (int i = first; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--verbose") {
            opts.engine.verbose = true;
        } else if (arg == "--type" && has_value) {
            auto t = fibscan::parse_scan_type(argv[++i]);
            if (!t) {
                fmt::print(stderr, "Error: unknown scan type '{}'\n", argv[i]);
                return std::nullopt;
            }
            opts.scan_type = *t;
        } else if (arg == "--max-pivots" && has_value) {
            char* end = nullptr;
            const long n = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || n < 4) {
                fmt::print(stderr, "Error: --max-pivots needs an integer >= 4\n");
                return std::nullopt;
            }
            opts.engine.scanner.max_pivots = static_cast<std::size_t>(n);
        } else if (arg == "--tolerance" && has_value) {
            char* end = nullptr;
            const double tol = std::strtod(argv[++i], &end);
            if (end == argv[i] || *end != '\0' || !(tol > 0.0 && tol < 1.0)) {
                fmt::print(stderr, "Error: --tolerance needs a fraction in (0, 1)\n");
                return std::nullopt;
            }
            opts.engine.scanner.fibonacci_tolerance = tol;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

/// Print the completion forecast of every potential pattern at `last_price`.
void print_forecasts(const fibscan::core::Engine& engine,
                     const fibscan::aggregator::PatternScan& scan,
                     double last_price) {
    for (const auto& p : scan.potential_patterns) {
        auto f = engine.predict_completion(p, last_price);
        if (!f) {
            continue;
        }
        fmt::print(
            "  {} {} C@{}: D≈{:.4f} in ~{:.0f} bars, p={:.1f}%, {} ({}), stop={:.4f}\n",
            fibscan::to_string(p.direction), fibscan::to_string(p.type),
            p.points.c.index, f->projected_completion, f->time_estimate,
            f->probability, f->plan.should_enter ? "ENTER" : "wait",
            f->plan.timeframe, f->plan.stop_loss);
    }
}

/// Run a full batch scan on the given CSV file.
/// Returns 0 on success, 1 on error.
int run_scan(const std::string& filepath, const CliOptions& opts) {
    auto series = fibscan::core::DataLoader::load_csv(filepath);
    if (!series) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }

    if (series->empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", filepath);
        return 1;
    }

    fmt::print("Loaded {} samples from '{}'\n", series->size(), filepath);

    fibscan::core::Engine engine(opts.engine);
    auto scan = engine.scan(*series, opts.scan_type);

    if (!scan) {
        std::vector<double> prices;
        std::vector<double> timestamps;
        fibscan::core::DataLoader::split(*series, prices, timestamps);
        if (engine.check_input(prices, timestamps) == fibscan::InputStatus::InsufficientData) {
            fmt::print(stderr,
                "Error: insufficient data ({} samples loaded, {} required)\n",
                series->size(), engine.min_series_length());
        } else {
            fmt::print(stderr,
                "Error: invalid input in '{}' (non-positive price or timestamps out of order)\n",
                filepath);
        }
        return 1;
    }

    fmt::print("{}", scan->to_string());
    if (!scan->potential_patterns.empty()) {
        fmt::print("Completion forecasts at last price {:.4f}:\n", series->back().price);
        print_forecasts(engine, *scan, series->back().price);
    }
    return 0;
}

/// Read CSV rows from stdin and rescan the rolling window after every row.
/// The header line is the first line of stdin.
/// Returns 0 on success, 1 on error.
int run_stream(const CliOptions& opts) {
    fibscan::core::Engine engine(opts.engine);

    // Enough history for the widest pattern plus its completion leg.
    const std::size_t window_cap =
        std::max(engine.min_series_length(), engine.config().scanner.max_bars * 4);

    std::deque<fibscan::PriceSample> window;
    std::string line;
    bool header_skipped = false;
    std::size_t row_count = 0;
    std::size_t last_complete  = 0;
    std::size_t last_potential = 0;

    fmt::print("fibscan streaming mode. Enter CSV rows (timestamp,price).\n");
    fmt::print("First line: header. Ctrl-D to finish.\n");

    while (std::getline(std::cin, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        auto sample = fibscan::core::DataLoader::parse_row(line);
        if (!sample || (!window.empty() && sample->timestamp < window.back().timestamp)) {
            fmt::print(stderr, "Skipping malformed row: {}\n", line);
            continue;
        }

        ++row_count;
        window.push_back(*sample);
        if (window.size() > window_cap) {
            window.pop_front();
        }
        if (window.size() < engine.min_series_length()) {
            continue;
        }

        const std::vector<fibscan::PriceSample> snapshot(window.begin(), window.end());
        auto scan = engine.scan(snapshot, opts.scan_type);
        if (!scan) {
            continue;
        }

        if (scan->completed_patterns.size() != last_complete ||
            scan->potential_patterns.size() != last_potential) {
            fmt::print("Row {:5d}: price={:.4f}  complete={}  potential={}\n",
                       row_count, sample->price,
                       scan->completed_patterns.size(),
                       scan->potential_patterns.size());
            if (!scan->patterns.empty()) {
                fmt::print("  best: {}\n", scan->patterns.front().to_string());
            }
            last_complete  = scan->completed_patterns.size();
            last_potential = scan->potential_patterns.size();
        }
    }

    fmt::print("Processed {} rows.\n", row_count);
    return 0;
}

/// Print every registered template with its ideal ratios.
int run_templates() {
    const fibscan::templates::TemplateRegistry registry;
    fmt::print("{:<30} {:>6} {:>6} {:>6} {:>6} {:>5}\n",
               "Template", "AB/XA", "BC/AB", "CD/BC", "AD/XA", "Rel");
    for (const auto& t : registry.all()) {
        fmt::print("{:<30} {:>6.3f} {:>6.3f} {:>6.3f} {:>6.3f} {:>5.0f}\n",
                   t.description, t.ab_xa.ideal, t.bc_ab.ideal,
                   t.cd_bc.ideal, t.ad_xa.ideal, t.reliability);
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

    if (mode == "--templates") {
        return run_templates();
    }

    if (mode == "--scan") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --scan requires a CSV file path\n");
            print_usage();
            return 1;
        }
        auto opts = parse_options(argc, argv, 3);
        if (!opts) {
            print_usage();
            return 1;
        }
        return run_scan(std::string(argv[2]), *opts);
    }

    if (mode == "--stream") {
        auto opts = parse_options(argc, argv, 2);
        if (!opts) {
            print_usage();
            return 1;
        }
        return run_stream(*opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
