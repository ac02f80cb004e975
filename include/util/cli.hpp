#pragma once

/**
 * CLI utilities for the backtest driver
 *
 * Provides command-line argument parsing and related utilities.
 * The trader itself takes no flags (plan file comes from the environment).
 */

#include "string_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace mpt {
namespace util {

/**
 * Command-line arguments for the backtest application.
 */
struct BacktestArgs {
    bool list_batches = false;
    bool strict = false;
    bool help = false;
    std::vector<std::string> debug_symbols; // repeatable -d
    std::vector<std::string> batch_ids;     // positional, replayed in order
};

/**
 * Print help message for the backtest application.
 */
inline void print_backtest_help(std::ostream& out = std::cout) {
    out << R"(
Batch Backtest Driver
=====================

Usage: mpt_backtest [options] [BATCH_ID...]

Options:
  -b, --batch-list       List available batches and exit
  -d, --debug-symbol SYM Only replay SYM (repeatable, or SYM1,SYM2)
  -s, --strict           Malformed rows and missing debug symbols are errors
  -h, --help             Show this help

Batches are subdirectories of the plan's backtest_dir, one <SYMBOL>.csv
per instrument. The plan is found through MPT_PLAN_DIR / MPT_PLAN_FILE.

Examples:
  mpt_backtest -b
  mpt_backtest 2024-01-02 2024-01-03
  mpt_backtest -s -d AAPL -d MSFT 2024-01-02
  mpt_backtest -d aapl,msft 2024-01-02
)";
}

/**
 * Parse command-line arguments into BacktestArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_backtest_args(int argc, char* argv[], BacktestArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--batch-list" || arg == "-b") {
            args.list_batches = true;
        }
        else if (arg == "--strict" || arg == "-s") {
            args.strict = true;
        }
        else if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--debug-symbol" || arg == "-d") {
            if (i + 1 >= argc) {
                std::cerr << "Missing symbol after " << arg << "\n";
                return false;
            }
            std::vector<std::string> syms = split_symbols(argv[++i]);
            if (syms.empty()) {
                std::cerr << "Empty symbol after " << arg << "\n";
                return false;
            }
            args.debug_symbols.insert(args.debug_symbols.end(), syms.begin(), syms.end());
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
        else {
            args.batch_ids.push_back(arg);
        }
    }
    return true;
}

}  // namespace util
}  // namespace mpt
