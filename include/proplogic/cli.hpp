// ============================================================================
// proplogic/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: read input → parse each formula → run the requested actions
// → print results.
//
// ============================================================================

#ifndef PROPLOGIC_CLI_HPP
#define PROPLOGIC_CLI_HPP

#include "proplogic/decision.hpp"
#include "proplogic/printer.hpp"

#include <string>
#include <vector>

namespace proplogic {

// ── Action ──────────────────────────────────────────────────────────────────

enum class Action {
    Classify,
    Eval,
    Simplify,
    Nnf,
    Cnf,
    Dnf,
    Table,
    Models,
    Equiv,
    Atoms,
    Subformulas
};

const char* action_name(Action a) noexcept;

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string         input;        // formula or path to a .txt file (empty if --selftest)
    std::vector<Action> actions;      // in command-line order; Classify if none given
    std::string         assignment;   // --eval argument
    std::string         other;        // --equiv argument
    SymbolTable         symbols = SymbolTable::ascii();
    DecisionOptions     decision;
    bool                selftest = false;
    bool                show_stats = false;
    bool                help = false;
    bool                all = false;  // conjoin every line of the input into one formula
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver: read input, process formulas, print results.
/// Returns the process exit code (0 = ok, 1 = errors encountered).
int run(const Options& opts);

}  // namespace proplogic

#endif  // PROPLOGIC_CLI_HPP
