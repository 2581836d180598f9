// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "proplogic/cli.hpp"
#include "proplogic/ast.hpp"
#include "proplogic/evaluator.hpp"
#include "proplogic/normalization.hpp"
#include "proplogic/parser.hpp"
#include "proplogic/simplify.hpp"
#include "proplogic/test.hpp"
#include "proplogic/traversal.hpp"
#include "proplogic/truth_table.hpp"
#include "proplogic/utils.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace proplogic {

const char* action_name(Action a) noexcept {
    switch (a) {
        case Action::Classify:    return "classify";
        case Action::Eval:        return "eval";
        case Action::Simplify:    return "simplify";
        case Action::Nnf:         return "nnf";
        case Action::Cnf:         return "cnf";
        case Action::Dnf:         return "dnf";
        case Action::Table:       return "table";
        case Action::Models:      return "models";
        case Action::Equiv:       return "equiv";
        case Action::Atoms:       return "atoms";
        case Action::Subformulas: return "subformulas";
    }
    return "?";
}

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    auto value_of = [&](int& i, const std::string& arg, const char* what) {
        if (i + 1 >= argc) {
            throw std::runtime_error(arg + " requires " + what);
        }
        return std::string(argv[++i]);
    };

    auto count_of = [&](int& i, const std::string& arg) {
        std::string text = value_of(i, arg, "a number argument");
        int n = 0;
        try {
            std::size_t used = 0;
            n = std::stoi(text, &used);
            if (used != text.size()) throw std::invalid_argument(text);
        } catch (const std::logic_error&) {
            throw std::runtime_error(arg + " requires a number, got '" + text + "'");
        }
        if (n < 0) {
            throw std::runtime_error(arg + " must be >= 0");
        }
        return n;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--all") {
            opts.all = true;
        } else if (arg == "--classify") {
            opts.actions.push_back(Action::Classify);
        } else if (arg == "--eval") {
            opts.assignment = value_of(i, arg, "an assignment argument");
            opts.actions.push_back(Action::Eval);
        } else if (arg == "--simplify") {
            opts.actions.push_back(Action::Simplify);
        } else if (arg == "--nnf") {
            opts.actions.push_back(Action::Nnf);
        } else if (arg == "--cnf") {
            opts.actions.push_back(Action::Cnf);
        } else if (arg == "--dnf") {
            opts.actions.push_back(Action::Dnf);
        } else if (arg == "--table") {
            opts.actions.push_back(Action::Table);
        } else if (arg == "--models") {
            opts.actions.push_back(Action::Models);
        } else if (arg == "--equiv") {
            opts.other = value_of(i, arg, "a formula argument");
            opts.actions.push_back(Action::Equiv);
        } else if (arg == "--atoms") {
            opts.actions.push_back(Action::Atoms);
        } else if (arg == "--subformulas") {
            opts.actions.push_back(Action::Subformulas);
        } else if (arg == "--backend") {
            std::string name = value_of(i, arg, "a backend name");
            if (name == "table") {
                opts.decision.backend = Backend::TruthTable;
            } else if (name == "z3") {
                opts.decision.backend = Backend::Z3;
            } else {
                throw std::runtime_error("unknown backend: " + name + " (expected table or z3)");
            }
        } else if (arg == "--symbols") {
            std::string name = value_of(i, arg, "a symbol table name");
            auto table = SymbolTable::by_name(name);
            if (!table) {
                throw std::runtime_error("unknown symbol table: " + name +
                                         " (expected ascii, unicode or words)");
            }
            opts.symbols = *table;
        } else if (arg == "--threads" || arg == "-j") {
            opts.decision.num_threads = count_of(i, arg);
        } else if (arg == "--table-limit") {
            opts.decision.table_atom_limit = static_cast<std::size_t>(count_of(i, arg));
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            // A lone '-' or a formula such as "-P" is not an option.
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple inputs not supported");
            }
            opts.input = arg;
        }
    }

    if (opts.actions.empty()) {
        opts.actions.push_back(Action::Classify);
    }

    // Validate: need either --selftest or an input.
    if (!opts.selftest && !opts.help && opts.input.empty()) {
        throw std::runtime_error("no input specified (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] <formula | input.txt>\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Propositional logic toolkit.\n"
        << "\n"
        << "Actions (several may be given; default --classify):\n"
        << "  --classify          Tautology, contradiction or contingent\n"
        << "  --eval A=1,B=0      Evaluate under an assignment (residual if partial)\n"
        << "  --simplify          Rule-based simplification\n"
        << "  --nnf               Negation normal form\n"
        << "  --cnf               Conjunctive normal form\n"
        << "  --dnf               Disjunctive normal form\n"
        << "  --table             Truth table\n"
        << "  --models            Satisfying assignments\n"
        << "  --equiv <formula>   Check equivalence with another formula\n"
        << "  --atoms             Atoms in first-occurrence order\n"
        << "  --subformulas       Subformulas, one per position\n"
        << "\n"
        << "Options:\n"
        << "  --backend table|z3          Decision backend (default table)\n"
        << "  --symbols ascii|unicode|words  Output notation (default ascii)\n"
        << "  --threads N, -j N           OpenMP threads (0 = auto, default)\n"
        << "  --table-limit N             Hand formulas with more than N atoms to Z3\n"
        << "                              (default 24, at most 62)\n"
        << "  --all                       Conjoin all formulas in the input file\n"
        << "  --stats                     Show per-formula statistics\n"
        << "  --selftest                  Run built-in tests\n"
        << "  --help, -h                  Show this message\n"
        << "\n"
        << "Input format:\n"
        << "  - A single formula, or a .txt file with one formula per line\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n";
}

// ── Per-formula processing ──────────────────────────────────────────────────

namespace {

void print_formula(std::uint32_t line_num, Action a, const FormulaFactory& f, FormulaId id,
                   const Options& opts) {
    std::cout << line_num << ": " << action_name(a) << " "
              << format_formula(f, id, opts.symbols) << "\n";
}

void perform(Action a, std::uint32_t line_num, FormulaId id, FormulaFactory& factory,
             const Options& opts) {
    switch (a) {
        case Action::Classify: {
            Classification c = classify(id, factory, opts.decision);
            std::cout << line_num << ": " << classification_name(c) << "\n";
            break;
        }

        case Action::Eval: {
            Interpretation interp = parse_assignment(opts.assignment);
            print_formula(line_num, a, factory, evaluate(id, interp, factory), opts);
            break;
        }

        case Action::Simplify:
            print_formula(line_num, a, factory, simplify(id, factory), opts);
            break;

        case Action::Nnf:
            print_formula(line_num, a, factory, to_nnf(id, factory), opts);
            break;

        case Action::Cnf:
            print_formula(line_num, a, factory, to_cnf(id, factory), opts);
            break;

        case Action::Dnf:
            print_formula(line_num, a, factory, to_dnf(id, factory), opts);
            break;

        case Action::Table: {
            TruthTable table = get_truth_table(id, factory, opts.decision.num_threads);
            std::cout << line_num << ": table\n" << table.to_string();
            break;
        }

        case Action::Models: {
            auto models = satisfying_assignments(id, factory, opts.decision);
            std::cout << line_num << ": models " << models.size() << "\n";
            for (const Interpretation& m : models) {
                std::cout << "  " << m.to_string() << "\n";
            }
            break;
        }

        case Action::Equiv: {
            FormulaId other = parse_formula(opts.other, factory);
            bool eq = is_equivalent(id, other, factory, opts.decision);
            std::cout << line_num << ": " << (eq ? "equivalent" : "not equivalent") << "\n";
            break;
        }

        case Action::Atoms: {
            std::cout << line_num << ": atoms";
            for (const std::string& name : get_atoms(factory, id)) {
                std::cout << " " << name;
            }
            std::cout << "\n";
            break;
        }

        case Action::Subformulas: {
            std::cout << line_num << ": subformulas\n";
            for (FormulaId sub : get_subformulas(factory, id)) {
                std::cout << "  " << format_formula(factory, sub, opts.symbols) << "\n";
            }
            break;
        }
    }
}

}  // namespace

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver loop.  Reads the input, processes each formula line, prints
// results.

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    if (opts.input.empty()) {
        std::cerr << "ERROR: no input specified (use --help for usage)\n";
        return 1;
    }

    // ── Read input ──────────────────────────────────────────────────────
    // A .txt argument is a file with one formula per line; anything else is
    // a single formula.
    std::vector<std::string> formulas;
    if (opts.input.ends_with(".txt")) {
        std::vector<std::string> lines;
        try {
            lines = read_lines(opts.input);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }

        if (opts.all) {
            std::string combined;
            for (const auto& line : lines) {
                std::string content = strip_comment(line);
                if (!content.empty()) {
                    if (!combined.empty()) {
                        combined += " & ";
                    }
                    combined += "(" + content + ")";
                }
            }
            formulas.push_back(combined);
        } else {
            formulas = std::move(lines);
        }
    } else {
        formulas.push_back(opts.input);
    }

    // ── Process each line ───────────────────────────────────────────────
    FormulaFactory factory;
    bool had_errors = false;

    for (std::size_t i = 0; i < formulas.size(); ++i) {
        std::uint32_t line_num = static_cast<std::uint32_t>(i + 1);
        std::string content = strip_comment(formulas[i]);

        // Skip blank / comment-only lines.
        if (content.empty()) {
            continue;
        }

        try {
            const auto t_start = std::chrono::steady_clock::now();

            FormulaId parsed = parse_formula(content, factory, Syntax::standard(), line_num);

            for (Action a : opts.actions) {
                perform(a, line_num, parsed, factory, opts);
            }

            if (opts.show_stats) {
                const double elapsed = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - t_start).count();
                std::cerr << "  Stats: nodes=" << node_count(factory, parsed)
                          << " depth=" << depth(factory, parsed)
                          << " atoms=" << get_atoms(factory, parsed).size()
                          << " factory=" << factory.size()
                          << " elapsed=" << elapsed << "s\n";
            }

        } catch (const SyntaxError& e) {
            // Already formatted as "<line>: ERROR: ... at column <n>".
            std::cerr << e.what() << "\n";
            had_errors = true;
        } catch (const std::exception& e) {
            std::cerr << line_num << ": ERROR: " << e.what() << "\n";
            had_errors = true;
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace proplogic
