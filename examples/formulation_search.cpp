/**
 * Formulation Search
 *
 * Command-line front end for the combination search engine:
 * - Components and group rules are given as arguments
 * - Progress is printed while workers run; Ctrl+C stops the search
 * - Totals and the first rows are printed, all rows optionally go to CSV
 *
 * Example (three ingredients summing to 1, at most two of group A present):
 *   formulation_search --component a1:A:0:1:0.1 --component a2:A:0:1:0.1 \
 *                      --component b1:B:0:0.5:0.05 --group A:maxCount=2 \
 *                      --total 1:1 --csv out.csv
 */

#include <combination/cli_args.hpp>
#include <combination/csv_export.hpp>
#include <combination/parallel_search.hpp>
#include <combination/validation.hpp>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace combination;
using namespace combination::cli;

static std::atomic<bool> g_stop_requested{false};

static void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        if (g_stop_requested.load()) {
            // Second Ctrl+C - force exit
            std::_Exit(1);
        }
        g_stop_requested.store(true);
    }
}

static void print_usage(const char* program) {
    printf("Usage: %s [options]\n", program);
    printf("  --component NAME:GROUP:MIN:MAX:STEP   ranged component (repeatable)\n");
    printf("  --fixed NAME:GROUP:VALUE              fixed component (repeatable)\n");
    printf("  --group GROUP:key=value[,key=value]   keys: minMass maxMass fixedMass minCount maxCount\n");
    printf("  --total MIN:MAX                       accepted total window (default 1:1)\n");
    printf("  --epsilon E                           comparison tolerance (default 1e-6)\n");
    printf("  --threads N                           workers (default: hardware threads)\n");
    printf("  --max-results N                       rows retained per worker\n");
    printf("  --display N                           rows printed (default 20)\n");
    printf("  --csv PATH                            write every retained row as CSV\n");
    printf("  --quiet                               no progress line\n");
}

static void print_row(const double* row, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        printf("%s%s", i ? ", " : "  ", format_value(row[i]).c_str());
    }
    printf("\n");
}

int main(int argc, char** argv) {
    SearchRequest request;
    SearchOptions options;
    size_t display_rows = 20;
    std::string csv_path;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw UsageError(arg + " needs a value");
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--component") {
                request.components.push_back(parse_component(next()));
            } else if (arg == "--fixed") {
                request.components.push_back(parse_fixed(next()));
            } else if (arg == "--group") {
                parse_group(next(), request);
            } else if (arg == "--total") {
                parse_total(next(), request);
            } else if (arg == "--epsilon") {
                request.epsilon = parse_number(next(), "epsilon");
            } else if (arg == "--threads") {
                options.num_workers = static_cast<size_t>(parse_count(next(), "threads", SIZE_MAX));
            } else if (arg == "--max-results") {
                request.max_stored_results = static_cast<size_t>(parse_count(next(), "max results", SIZE_MAX));
            } else if (arg == "--display") {
                display_rows = static_cast<size_t>(parse_count(next(), "display", SIZE_MAX));
            } else if (arg == "--csv") {
                csv_path = next();
            } else if (arg == "--quiet") {
                quiet = true;
            } else {
                throw UsageError("unknown option '" + arg + "'");
            }
        }
    } catch (const UsageError& e) {
        fprintf(stderr, "error: %s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }

    // Without a CSV target only the displayed rows matter
    options.display_cap = display_rows;
    if (csv_path.empty() && !request.max_stored_results) {
        request.max_stored_results = display_rows;
    }

    if (auto problem = check_request(request)) {
        fprintf(stderr, "error: %s\n", problem->c_str());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ParallelSearch search(options);
    if (!quiet) {
        search.set_progress_callback([](const ResultAggregator& results) {
            fprintf(stderr, "\r  %6.2f%%  processed %llu  valid %llu",
                    results.progress_percent(),
                    static_cast<unsigned long long>(results.total_processed()),
                    static_cast<unsigned long long>(results.total_valid()));
            fflush(stderr);
        });
    }

    SearchSummary summary;
    try {
        summary = search.run_with_abort(request, [] { return g_stop_requested.load(); });
    } catch (const ValidationError& e) {
        fprintf(stderr, "error: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "\nsearch failed: %s\n", e.what());
        return 1;
    }
    if (!quiet) fprintf(stderr, "\n");

    const ResultAggregator& results = search.results();
    printf("=== Formulation Search ===\n");
    printf("  Workers:   %zu\n", summary.num_workers);
    printf("  Leaves:    %llu of %llu%s\n",
           static_cast<unsigned long long>(summary.processed),
           static_cast<unsigned long long>(summary.expected),
           summary.cancelled ? " (stopped)" : "");
    printf("  Valid:     %llu\n", static_cast<unsigned long long>(summary.valid));
    printf("  Retained:  %llu\n", static_cast<unsigned long long>(summary.stored));
    printf("  Time:      %.1f ms\n\n", summary.elapsed_ms);

    if (results.display_row_count() > 0) {
        auto names = request.component_names();
        for (size_t i = 0; i < names.size(); ++i) {
            printf("%s%s", i ? ", " : "  ", names[i].c_str());
        }
        printf("\n");
        for (size_t r = 0; r < results.display_row_count(); ++r) {
            print_row(results.display_row(r), results.row_width());
        }
        if (results.truncated()) {
            printf("  ... (%llu more retained)\n",
                   static_cast<unsigned long long>(summary.stored - results.display_row_count()));
        }
    }

    if (!csv_path.empty()) {
        std::ofstream out(csv_path);
        if (!out) {
            fprintf(stderr, "error: cannot open '%s' for writing\n", csv_path.c_str());
            return 1;
        }
        try {
            size_t written = write_csv(out, request.component_names(), results);
            printf("\nWrote %zu rows to %s\n", written, csv_path.c_str());
        } catch (const std::exception& e) {
            fprintf(stderr, "error: %s\n", e.what());
            return 1;
        }
    }

    return 0;
}
