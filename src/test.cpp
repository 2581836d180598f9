// ============================================================================
// test.cpp — Self-test suite for the proplogic toolkit
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation (ASCII, Unicode and word spellings, positions)
//   - Parser precedence, associativity and error reporting
//   - Formula interning and atom-name validation
//   - Traversal queries (atoms, subformulas, substitution, size)
//   - Evaluation (total, partial, unwrap errors, row evaluation)
//   - Simplification rules, idempotence and equivalence
//   - Normal forms (NNF, CNF, DNF) and their shape predicates
//   - Decision procedures, models and classification
//   - Truth tables
//   - Z3 backend agreement and parallel / sequential agreement
//   - Printer round-trips and CLI helpers
//
// ============================================================================

#include "proplogic/test.hpp"
#include "proplogic/ast.hpp"
#include "proplogic/cli.hpp"
#include "proplogic/decision.hpp"
#include "proplogic/errors.hpp"
#include "proplogic/evaluator.hpp"
#include "proplogic/lexer.hpp"
#include "proplogic/normalization.hpp"
#include "proplogic/parser.hpp"
#include "proplogic/printer.hpp"
#include "proplogic/simplify.hpp"
#include "proplogic/traversal.hpp"
#include "proplogic/truth_table.hpp"
#include "proplogic/utils.hpp"
#include "proplogic/z3_solver.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace proplogic {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL [" << current_test_ << "]: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL [" << current_test_ << "]: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string pp(const std::string& input) {
    FormulaFactory f;
    FormulaId id = parse_formula(input, f);
    return f.to_string(id);
}

using Transform = FormulaId (*)(FormulaId, FormulaFactory&);

static std::string pp_with(Transform fn, const std::string& input) {
    FormulaFactory f;
    FormulaId id = parse_formula(input, f);
    return f.to_string(fn(id, f));
}

static std::optional<SyntaxError> parse_error(const std::string& input) {
    FormulaFactory f;
    return try_parse(input, f).error;
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += " ";
        out += items[i];
    }
    return out;
}

static std::string models_to_string(const std::vector<Interpretation>& models) {
    std::vector<std::string> parts;
    for (const auto& m : models) parts.push_back(m.to_string());
    return join(parts);
}

static bool mentions_kind(const FormulaFactory& f, FormulaId id, NodeKind k) {
    for (FormulaId sub : get_subformulas(f, id)) {
        if (f.node(sub).kind == k) return true;
    }
    return false;
}

// Conjunction (or disjunction) of atoms x0 .. x{n-1}.
static FormulaId wide_formula(FormulaFactory& f, std::size_t n, NodeKind k) {
    FormulaId acc = f.make_atom("x0");
    for (std::size_t i = 1; i < n; ++i) {
        acc = f.make_binary(k, acc, f.make_atom("x" + std::to_string(i)));
    }
    return acc;
}

// A fixed corpus exercising every connective, constants and sharing.
static const std::vector<std::string>& corpus() {
    static const std::vector<std::string> formulas = {
        "P",
        "~P",
        "P & Q",
        "P | Q & R",
        "(P -> Q) -> R",
        "P -> Q -> R",
        "P <-> ~Q",
        "P ^ Q ^ R",
        "~(P & (Q | ~R)) <-> S",
        "(P ^ Q) -> (R <-> P)",
        "~~(P | false) & (Q -> true)",
        "((P & Q) | R) -> (S <-> ~T)",
        "(P & Q & R) | (~P & ~Q & ~R)",
        "P & ~P",
        "P | ~P",
        "true",
        "false",
        "~(P <-> Q) | (R ^ ~S)",
        "(P | Q) & (P | ~Q) & (~P | R)",
    };
    return formulas;
}

// ============================================================================
// Lexer Tests
// ============================================================================

static void test_lexer_ascii_connectives(TestContext& ctx) {
    auto toks = tokenise("~ ! & | -> >> <-> << ^ ( ) P true false");
    ctx.check(toks.size() == 15, "15 tokens including Eof");
    ctx.check(toks[0].kind == TokenKind::Not, "~ negation");
    ctx.check(toks[1].kind == TokenKind::Not, "! negation");
    ctx.check(toks[2].kind == TokenKind::And, "& conjunction");
    ctx.check(toks[3].kind == TokenKind::Or, "| disjunction");
    ctx.check(toks[4].kind == TokenKind::Implies, "-> implication");
    ctx.check(toks[5].kind == TokenKind::Implies, ">> implication");
    ctx.check(toks[6].kind == TokenKind::Iff, "<-> biconditional");
    ctx.check(toks[7].kind == TokenKind::Iff, "<< biconditional");
    ctx.check(toks[8].kind == TokenKind::Xor, "^ exclusive or");
    ctx.check(toks[9].kind == TokenKind::LParen, "( paren");
    ctx.check(toks[10].kind == TokenKind::RParen, ") paren");
    ctx.check(toks[11].kind == TokenKind::Identifier && toks[11].text == "P", "identifier P");
    ctx.check(toks[12].kind == TokenKind::KwTrue, "true keyword");
    ctx.check(toks[13].kind == TokenKind::KwFalse, "false keyword");
    ctx.check(toks[14].kind == TokenKind::Eof, "Eof");
}

static void test_lexer_unicode_connectives(TestContext& ctx) {
    // ¬P ∧ Q ∨ R → S ↔ T ⊕ U
    auto toks = tokenise("\xC2\xACP \xE2\x88\xA7 Q \xE2\x88\xA8 R \xE2\x86\x92 S "
                         "\xE2\x86\x94 T \xE2\x8A\x95 U");
    ctx.check(toks.size() == 13, "13 tokens including Eof");
    ctx.check(toks[0].kind == TokenKind::Not, "negation sign");
    ctx.check(toks[1].kind == TokenKind::Identifier && toks[1].pos.offset == 2,
              "P follows the two-byte negation sign");
    ctx.check(toks[2].kind == TokenKind::And, "logical and");
    ctx.check(toks[4].kind == TokenKind::Or, "logical or");
    ctx.check(toks[6].kind == TokenKind::Implies, "rightwards arrow");
    ctx.check(toks[8].kind == TokenKind::Iff, "left right arrow");
    ctx.check(toks[10].kind == TokenKind::Xor, "circled plus");
}

static void test_lexer_word_connectives(TestContext& ctx) {
    auto toks = tokenise("not P and Q or R implies S iff T xor U");
    ctx.check(toks[0].kind == TokenKind::Not, "not");
    ctx.check(toks[2].kind == TokenKind::And, "and");
    ctx.check(toks[4].kind == TokenKind::Or, "or");
    ctx.check(toks[6].kind == TokenKind::Implies, "implies");
    ctx.check(toks[8].kind == TokenKind::Iff, "iff");
    ctx.check(toks[10].kind == TokenKind::Xor, "xor");

    auto upper = tokenise("NOT P AND Q OR R IMPLIES S IFF T XOR U");
    ctx.check(upper[0].kind == TokenKind::Not && upper[2].kind == TokenKind::And &&
              upper[4].kind == TokenKind::Or && upper[6].kind == TokenKind::Implies &&
              upper[8].kind == TokenKind::Iff && upper[10].kind == TokenKind::Xor,
              "upper-case word connectives");

    auto ids = tokenise("nota andy Or");
    ctx.check(ids[0].kind == TokenKind::Identifier, "nota is an identifier");
    ctx.check(ids[1].kind == TokenKind::Identifier, "andy is an identifier");
    ctx.check(ids[2].kind == TokenKind::Identifier, "Or is an identifier (case-sensitive)");
}

static void test_lexer_positions(TestContext& ctx) {
    auto toks = tokenise("P &\n  Q");
    ctx.check(toks[0].pos.offset == 0 && toks[0].pos.line == 1 && toks[0].pos.column == 1,
              "P at 1:1");
    ctx.check(toks[1].pos.offset == 2 && toks[1].pos.column == 3, "& at column 3");
    ctx.check(toks[2].pos.offset == 6 && toks[2].pos.line == 2 && toks[2].pos.column == 3,
              "Q at 2:3");
}

static void test_lexer_errors(TestContext& ctx) {
    try {
        tokenise("P $ Q");
        ctx.check(false, "'$' should be rejected");
    } catch (const SyntaxError& e) {
        ctx.check(e.offset() == 2 && e.column() == 3, "'$' reported at offset 2");
        ctx.check_eq(e.reason(), "unexpected character '$'", "'$' reason");
    }

    try {
        tokenise("P & 1Q");
        ctx.check(false, "'1Q' should be rejected");
    } catch (const SyntaxError& e) {
        ctx.check(e.offset() == 4, "'1Q' reported at offset 4");
        ctx.check_eq(e.reason(), "atom names must not start with a digit", "digit reason");
    }

    // U+21D2 is not a connective; the message quotes the whole code point.
    try {
        tokenise("P \xE2\x87\x92 Q");
        ctx.check(false, "double arrow should be rejected");
    } catch (const SyntaxError& e) {
        ctx.check(e.offset() == 2, "double arrow reported at offset 2");
        ctx.check_eq(e.reason(), "unexpected character '\xE2\x87\x92'", "multi-byte reason");
    }

    try {
        tokenise("P \x80");
        ctx.check(false, "stray continuation byte should be rejected");
    } catch (const SyntaxError& e) {
        ctx.check_eq(e.reason(), "unexpected character '\x80'", "continuation byte reason");
    }
}

static void test_lexer_custom_syntax(TestContext& ctx) {
    Syntax s;
    s.add(TokenKind::Not, "-").add(TokenKind::And, "*").add(TokenKind::Or, "+");

    FormulaFactory f;
    FormulaId id = parse_formula("-P * Q + R", f, s);
    ctx.check_eq(f.to_string(id), "(((~P) & Q) | R)", "custom spellings");

    ctx.check(try_parse("P & Q", f, s).error.has_value(), "& unknown to custom syntax");

    using Bad = std::invalid_argument;
    ctx.check_throws<Bad>([] { Syntax t; t.add(TokenKind::And, ""); }, "empty spelling");
    ctx.check_throws<Bad>([] { Syntax t; t.add(TokenKind::And, "a&"); }, "mixed spelling");
    ctx.check_throws<Bad>([] { Syntax t; t.add(TokenKind::And, "true"); }, "literal spelling");
    ctx.check_throws<Bad>([] { Syntax t; t.add(TokenKind::LParen, "lp"); }, "non-connective");
    ctx.check_throws<Bad>([&] { Syntax t = s; t.add(TokenKind::Or, "*"); }, "rebinding a spelling");

    Syntax std_syntax = Syntax::standard();
    std_syntax.clear(TokenKind::Xor);
    ctx.check(std_syntax.spellings(TokenKind::Xor).empty(), "clear removes spellings");
    ctx.check(std_syntax.classify_word("xor") == TokenKind::Identifier, "xor is free again");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_basic(TestContext& ctx) {
    ctx.check_eq(pp("P"), "P", "atom");
    ctx.check_eq(pp("true"), "true", "true");
    ctx.check_eq(pp("false"), "false", "false");
    ctx.check_eq(pp("~P"), "(~P)", "negation");
    ctx.check_eq(pp("!P"), "(~P)", "! negation");
    ctx.check_eq(pp("P & Q"), "(P & Q)", "conjunction");
    ctx.check_eq(pp("P | Q"), "(P | Q)", "disjunction");
    ctx.check_eq(pp("P -> Q"), "(P -> Q)", "implication");
    ctx.check_eq(pp("P <-> Q"), "(P <-> Q)", "biconditional");
    ctx.check_eq(pp("P ^ Q"), "(P ^ Q)", "exclusive or");
    ctx.check_eq(pp("  P_1  "), "P_1", "surrounding whitespace");
    ctx.check_eq(pp("true & false"), "(true & false)", "constants as operands");
}

static void test_parse_precedence(TestContext& ctx) {
    ctx.check_eq(pp("P | Q & R"), "(P | (Q & R))", "& binds tighter than |");
    ctx.check_eq(pp("~P & Q"), "((~P) & Q)", "~ binds tighter than &");
    ctx.check_eq(pp("P -> Q | R"), "(P -> (Q | R))", "| binds tighter than ->");
    ctx.check_eq(pp("P <-> Q -> R"), "(P <-> (Q -> R))", "-> binds tighter than <->");
    ctx.check_eq(pp("P ^ Q <-> R"), "((P ^ Q) <-> R)", "^ and <-> share a level");
    ctx.check_eq(pp("(P | Q) & R"), "((P | Q) & R)", "parentheses override");
    ctx.check_eq(pp("not P and Q"), "((~P) & Q)", "word spellings");
    ctx.check_eq(pp("P >> Q << R"), "((P -> Q) <-> R)", "shift spellings");
}

static void test_parse_associativity(TestContext& ctx) {
    ctx.check_eq(pp("P & Q & R"), "((P & Q) & R)", "& left-assoc");
    ctx.check_eq(pp("P | Q | R"), "((P | Q) | R)", "| left-assoc");
    ctx.check_eq(pp("P -> Q -> R"), "(P -> (Q -> R))", "-> right-assoc");
    ctx.check_eq(pp("P <-> Q <-> R"), "((P <-> Q) <-> R)", "<-> left-assoc");
    ctx.check_eq(pp("P ^ Q ^ R"), "((P ^ Q) ^ R)", "^ left-assoc");
    ctx.check_eq(pp("~~P"), "(~(~P))", "~ nests to the right");
}

static void test_parse_errors(TestContext& ctx) {
    auto e = parse_error("");
    ctx.check(e && e->offset() == 0, "empty input fails at offset 0");
    ctx.check(e && e->reason() == "expected operand, got end of input", "empty input reason");

    e = parse_error("P &");
    ctx.check(e && e->offset() == 3 && e->column() == 4, "dangling & fails at offset 3");

    e = parse_error("(P & Q");
    ctx.check(e && e->offset() == 6, "missing ) fails at end of input");
    ctx.check(e && e->reason().rfind("unbalanced '('", 0) == 0, "missing ) reason");

    e = parse_error("P & Q)");
    ctx.check(e && e->offset() == 5 && e->reason() == "unbalanced ')'", "stray )");

    e = parse_error("P Q");
    ctx.check(e && e->offset() == 2, "trailing input at offset 2");
    ctx.check(e && e->reason() == "unexpected token 'Q' after formula", "trailing input reason");

    e = parse_error("& P");
    ctx.check(e && e->offset() == 0 && e->reason() == "expected operand before '&'",
              "missing left operand");

    e = parse_error("()");
    ctx.check(e && e->offset() == 1 && e->reason() == "expected operand before ')'",
              "empty parentheses");

    e = parse_error("P -> -> Q");
    ctx.check(e && e->offset() == 5, "doubled connective");

    // what() carries the line number and column.
    FormulaFactory f;
    try {
        parse_formula("P &", f, Syntax::standard(), 3);
        ctx.check(false, "dangling & should throw");
    } catch (const SyntaxError& err) {
        ctx.check_eq(err.what(), "3: ERROR: expected operand, got end of input at column 4",
                     "error message format");
    }
}

static void test_parse_nesting_limit(TestContext& ctx) {
    FormulaFactory f;
    const std::size_t limit = Parser::kMaxNesting;

    ParseResult ok = try_parse(std::string(limit, '~') + "P", f);
    ctx.check(ok.ok(), "negation nested exactly to the limit parses");

    ParseResult deep = try_parse(std::string(limit + 1, '~') + "P", f);
    ctx.check(!deep.ok(), "negation beyond the limit fails");
    ctx.check(deep.error && deep.error->offset() == limit, "failure at the first excess ~");
    ctx.check(deep.error && deep.error->reason() == "formula nested too deeply",
              "nesting reason");

    ParseResult parens = try_parse(std::string(3000, '(') + "P" + std::string(3000, ')'), f);
    ctx.check(!parens.ok(), "deep parentheses fail");
}

// "P op P op ... op P" with `operators` connectives.
static std::string flat_chain(const std::string& op, std::size_t operators) {
    std::string out = "P";
    for (std::size_t i = 0; i < operators; ++i) out += " " + op + " P";
    return out;
}

static void test_parse_chain_limit(TestContext& ctx) {
    FormulaFactory f;
    const std::size_t limit = Parser::kMaxNesting;

    ParseResult ok = try_parse(flat_chain("&", limit), f);
    ctx.check(ok.ok(), "& chain exactly at the limit parses");
    if (ok.ok()) {
        ctx.check(depth(f, ok.formula) == limit + 1, "one level per operator");
        ctx.check_eq(f.to_string(simplify(ok.formula, f)), "P", "long chain simplifies");
        ctx.check(to_cnf(ok.formula, f) == ok.formula, "long chain is already CNF");
    }

    // Each operator of the chain adds one level; the first excess one is reported.
    ParseResult deep = try_parse(flat_chain("&", limit + 1), f);
    ctx.check(!deep.ok(), "& chain beyond the limit fails");
    ctx.check(deep.error && deep.error->offset() == 2 + 4 * limit,
              "failure at the first excess &");
    ctx.check(deep.error && deep.error->reason() == "formula nested too deeply",
              "chain nesting reason");

    ctx.check(!try_parse(flat_chain("|", 100000), f).ok(), "long | chain fails");
    ctx.check(!try_parse(flat_chain("<->", 5000), f).ok(), "long <-> chain fails");
    ctx.check(!try_parse(flat_chain("^", 5000), f).ok(), "long ^ chain fails");

    // A closed chain gives its levels back.
    std::string half = "(" + flat_chain("&", limit - 100) + ")";
    ctx.check(try_parse(half + " | " + half, f).ok(), "sibling chains are counted separately");
    ctx.check(!try_parse(std::string(200, '~') + half, f).ok(),
              "negations and chain levels add up");

    // Distinct atoms: the left spine is as deep as the chain.
    std::string atoms = "x0";
    for (std::size_t i = 1; i <= limit; ++i) atoms += " & x" + std::to_string(i);
    ParseResult spine = try_parse(atoms, f);
    ctx.check(spine.ok(), "distinct-atom chain at the limit parses");
    if (spine.ok()) {
        FormulaId nnf = to_nnf(spine.formula, f);
        ctx.check(nnf == spine.formula, "deep spine survives normalisation");
        ctx.check(simplify(spine.formula, f) == spine.formula, "deep spine survives simplify");
        ctx.check(format_formula(f, spine.formula) == atoms, "deep spine prints back");
    }
}

static void test_try_parse(TestContext& ctx) {
    FormulaFactory f;
    ParseResult good = try_parse("P & Q", f);
    ctx.check(good.ok() && good.formula == f.make_and(f.make_atom("P"), f.make_atom("Q")),
              "try_parse success");

    ParseResult bad = try_parse("P & (Q", f);
    ctx.check(!bad.ok() && bad.formula == kInvalidId, "try_parse failure reports no formula");
    ctx.check(bad.error && bad.error->line() == 1, "try_parse error line");
}

// ============================================================================
// Formula Tree Tests
// ============================================================================

static void test_interning(TestContext& ctx) {
    FormulaFactory f;
    FormulaId p = f.make_atom("P");
    FormulaId q = f.make_atom("Q");

    ctx.check(f.make_atom("P") == p, "atoms intern by name");
    ctx.check(f.make_atom("p") != p, "atom names are case-sensitive");
    ctx.check(f.make_and(p, q) == f.make_and(p, q), "structural equality");
    ctx.check(f.make_and(p, q) != f.make_and(q, p), "operand order matters");
    ctx.check(f.make_and(p, q) != f.make_or(p, q), "kind matters");
    ctx.check(f.make_binary(NodeKind::Xor, p, q) == f.make_xor(p, q), "make_binary");
    ctx.check(f.make_constant(true) == f.make_true(), "make_constant(true)");
    ctx.check(f.constant_value(f.make_false()) == false, "constant_value(false)");
    ctx.check(!f.constant_value(p).has_value(), "constant_value(atom)");

    ctx.check_throws<std::invalid_argument>([&] { f.make_binary(NodeKind::Not, p, q); },
                                            "make_binary rejects Not");

    const FormulaNode& n = f.node(f.make_implies(p, q));
    ctx.check(n.kind == NodeKind::Implies && n.children[0] == p && n.children[1] == q,
              "node() exposes the tree shape");
}

static void test_atom_names(TestContext& ctx) {
    FormulaFactory f;
    auto rejects = [&](const std::string& name) {
        try {
            f.make_atom(name);
        } catch (const InvalidAtomNameError& e) {
            return e.name() == name;
        }
        return false;
    };
    ctx.check(rejects(""), "empty name");
    ctx.check(rejects("1P"), "leading digit");
    ctx.check(rejects("P Q"), "space");
    ctx.check(rejects("P-Q"), "hyphen");
    ctx.check(rejects("true"), "true is reserved");
    ctx.check(rejects("and"), "and is reserved");
    ctx.check(rejects("XOR"), "XOR is reserved");
    ctx.check(!rejects("_p1"), "underscore start");
    ctx.check(!rejects("Implies"), "reserved words are case-sensitive");
    ctx.check(is_reserved_word("iff") && !is_reserved_word("P"), "is_reserved_word");

    auto e = parse_error("P & and");
    ctx.check(e && e->offset() == 4, "reserved word in operand position");
}

// ============================================================================
// Traversal Tests
// ============================================================================

static void test_atoms(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("Q & (P | Q) -> R", f);
    ctx.check_eq(join(get_atoms(f, id)), "Q P R", "first-occurrence order");
    ctx.check_eq(join(sorted_atoms(f, id)), "P Q R", "sorted order");

    FormulaId a = parse_formula("P & R", f);
    FormulaId b = parse_formula("Q | P", f);
    ctx.check_eq(join(sorted_atoms(f, a, b)), "P Q R", "sorted union");

    ctx.check(get_atoms(f, parse_formula("true | false", f)).empty(), "no atoms in constants");
}

static void test_subformulas(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("P & ~P", f);
    std::vector<FormulaId> subs = get_subformulas(f, id);
    ctx.check(subs.size() == 4, "one entry per position");
    ctx.check(subs.size() == 4 && subs[0] == id, "root first");
    ctx.check(subs.size() == 4 && subs[1] == f.make_atom("P") && subs[3] == f.make_atom("P"),
              "duplicates kept");
    ctx.check(subs.size() == 4 && subs[2] == f.make_not(f.make_atom("P")), "pre-order");

    ctx.check(get_subformulas(f, f.make_atom("Z")).size() == 1, "atom has itself only");
}

static void test_substitute(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("P & Q", f);

    Substitution m{{"P", parse_formula("R | S", f)}};
    FormulaId out = substitute(id, m, f);
    ctx.check(out == parse_formula("(R | S) & Q", f), "P replaced by R | S");
    ctx.check_eq(f.to_string(out), "((R | S) & Q)", "substitution result text");

    Substitution swap{{"P", f.make_atom("Q")}, {"Q", f.make_atom("P")}};
    ctx.check(substitute(id, swap, f) == parse_formula("Q & P", f), "simultaneous replacement");

    ctx.check(substitute(id, {}, f) == id, "empty mapping");
    Substitution unrelated{{"Z", f.make_true()}};
    ctx.check(substitute(id, unrelated, f) == id, "unmentioned atom");
}

static void test_size_queries(TestContext& ctx) {
    FormulaFactory f;
    ctx.check(node_count(f, parse_formula("P & ~P", f)) == 4, "node_count counts positions");
    ctx.check(depth(f, parse_formula("P & ~Q", f)) == 3, "depth of P & ~Q");
    ctx.check(depth(f, f.make_atom("P")) == 1, "depth of an atom");

    ctx.check(is_atomic(f, f.make_atom("P")), "atom is atomic");
    ctx.check(is_atomic(f, f.make_true()), "constant is atomic");
    ctx.check(!is_atomic(f, parse_formula("~P", f)), "negation is not atomic");

    FormulaId big = parse_formula("P & (Q | R)", f);
    ctx.check(contains(f, big, parse_formula("Q | R", f)), "contains a subtree");
    ctx.check(contains(f, big, big), "contains itself");
    ctx.check(!contains(f, big, parse_formula("R | Q", f)), "commuted subtree is different");
}

// ============================================================================
// Evaluator Tests
// ============================================================================

static void test_interpretation(TestContext& ctx) {
    Interpretation a{{"P", true}};
    Interpretation b = a.with("Q", false);
    ctx.check(a.size() == 1 && b.size() == 2, "with() returns a new mapping");
    ctx.check(b.lookup("Q") == false && b.lookup("P") == true, "lookup");
    ctx.check(!b.lookup("R").has_value(), "lookup miss");
    ctx.check_eq(b.to_string(), "{P=1, Q=0}", "to_string");

    ctx.check_throws<InvalidAtomNameError>([&] { a.with("1x", true); }, "invalid atom name");
}

static void test_evaluate_total(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("P & (Q -> R)", f);
    Interpretation i{{"P", true}, {"Q", false}, {"R", true}};
    ctx.check(evaluate(id, i, f) == f.make_true(), "P & (Q -> R) with P=1 Q=0 R=1");
    ctx.check(evaluate_bool(id, i, f), "evaluate_bool");

    // One row per connective and operand pattern.
    struct Row { const char* formula; bool p, q, expected; };
    const Row rows[] = {
        {"P & Q", true, true, true},     {"P & Q", true, false, false},
        {"P | Q", false, true, true},    {"P | Q", false, false, false},
        {"P -> Q", true, false, false},  {"P -> Q", false, false, true},
        {"P <-> Q", false, false, true}, {"P <-> Q", true, false, false},
        {"P ^ Q", true, false, true},    {"P ^ Q", true, true, false},
    };
    for (const Row& r : rows) {
        Interpretation ri{{"P", r.p}, {"Q", r.q}};
        ctx.check(evaluate_bool(parse_formula(r.formula, f), ri, f) == r.expected,
                  std::string(r.formula) + " P=" + (r.p ? "1" : "0") + " Q=" + (r.q ? "1" : "0"));
    }

    FormulaId f1 = parse_formula("((P & Q) | R) -> (S <-> ~T)", f);
    ctx.check(evaluate_bool(f1, {{"P", true}, {"Q", false}, {"R", true}, {"S", false}, {"T", true}}, f),
              "complex formula 1");
    FormulaId f2 = parse_formula("~(P & (Q | R)) | (S & T)", f);
    ctx.check(!evaluate_bool(f2, {{"P", true}, {"Q", true}, {"R", false}, {"S", false}, {"T", true}}, f),
              "complex formula 2");
    FormulaId f4 = parse_formula("(((P -> Q) -> (Q -> R)) -> (R -> S)) -> (S -> T)", f);
    ctx.check(!evaluate_bool(f4, {{"P", false}, {"Q", true}, {"R", false}, {"S", true}, {"T", false}}, f),
              "left-nested implication chain");
}

static void test_evaluate_partial(TestContext& ctx) {
    FormulaFactory f;
    auto residual = [&](const std::string& src, const Interpretation& i) {
        return f.to_string(evaluate(parse_formula(src, f), i, f));
    };

    ctx.check_eq(residual("P & Q", {{"P", true}}), "Q", "T & Q");
    ctx.check_eq(residual("P & Q", {{"P", false}}), "false", "F & Q short-circuits");
    ctx.check_eq(residual("P | Q", {{"Q", false}}), "P", "P | F");
    ctx.check_eq(residual("P -> Q", {{"Q", false}}), "(~P)", "P -> F");
    ctx.check_eq(residual("P -> Q", {{"P", false}}), "true", "F -> Q");
    ctx.check_eq(residual("P ^ Q", {{"P", true}}), "(~Q)", "T ^ Q");
    ctx.check_eq(residual("P <-> Q", {{"P", false}}), "(~Q)", "F <-> Q");
    ctx.check_eq(residual("(P & Q) | R", {{"R", false}}), "(P & Q)", "nested residual");
    ctx.check_eq(residual("P & Q", {}), "(P & Q)", "empty interpretation");
}

static void test_evaluate_unbound(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("(P & Q) | (R & S)", f);
    try {
        evaluate_bool(id, {{"P", true}, {"R", true}}, f);
        ctx.check(false, "unbound atoms should throw");
    } catch (const UnboundAtomError& e) {
        ctx.check_eq(join(e.atoms()), "Q S", "unbound atoms named");
    }

    // A decided formula needs no further bindings.
    ctx.check(evaluate_bool(parse_formula("P | Q", f), {{"P", true}}, f), "short-circuit unwrap");
}

static void test_row_evaluator(TestContext& ctx) {
    FormulaFactory f;
    FormulaId id = parse_formula("P & ~Q", f);
    RowEvaluator eval(f, id, {"P", "Q"});
    ctx.check(eval.row_count() == 4, "four rows");
    ctx.check(!eval(0) && !eval(1) && eval(2) && !eval(3), "rows of P & ~Q");
    ctx.check(eval.atom_value(2, 0) && !eval.atom_value(2, 1), "first atom is the high bit");

    bool unbound = false;
    try {
        RowEvaluator missing(f, id, {"P"});
    } catch (const UnboundAtomError& e) {
        unbound = e.atoms().size() == 1 && e.atoms()[0] == "Q";
    }
    ctx.check(unbound, "missing atom is reported");

    std::vector<std::string> names;
    for (int i = 0; i < 62; ++i) names.push_back("x" + std::to_string(i));
    RowEvaluator widest(f, f.make_atom("x0"), names);
    ctx.check(widest.row_count() == (std::uint64_t{1} << 62), "62 atoms still enumerate");
    ctx.check(widest(std::uint64_t{1} << 61) && !widest(0), "x0 is the high bit of 62");

    names.push_back("x62");
    ctx.check_throws<std::length_error>([&] { RowEvaluator wide(f, f.make_atom("x0"), names); },
                                        "63 atoms cannot be enumerated");
    names.push_back("x63");
    ctx.check_throws<std::length_error>([&] { RowEvaluator wide(f, f.make_atom("x0"), names); },
                                        "64 atoms cannot be enumerated");
}

// ============================================================================
// Simplifier Tests
// ============================================================================

static void test_simplify_rules(TestContext& ctx) {
    auto s = [](const std::string& src) { return pp_with(simplify, src); };

    ctx.check_eq(s("(P & true) | false"), "P", "constant absorption");
    ctx.check_eq(s("Q & (P | true)"), "Q", "nested constant");
    ctx.check_eq(s("P & false"), "false", "f & F");
    ctx.check_eq(s("~true"), "false", "~T");
    ctx.check_eq(s("~~P"), "P", "double negation");
    ctx.check_eq(s("P & P"), "P", "idempotent &");
    ctx.check_eq(s("P | P"), "P", "idempotent |");
    ctx.check_eq(s("P | ~P"), "true", "excluded middle");
    ctx.check_eq(s("~P & P"), "false", "complement, either order");
    ctx.check_eq(s("P & (P | Q)"), "P", "absorption &");
    ctx.check_eq(s("(Q | P) & P"), "P", "absorption & mirrored");
    ctx.check_eq(s("P | (Q & P)"), "P", "absorption |");
    ctx.check_eq(s("P -> P"), "true", "f -> f");
    ctx.check_eq(s("P <-> P"), "true", "f <-> f");
    ctx.check_eq(s("P ^ P"), "false", "f ^ f");
    ctx.check_eq(s("P -> false"), "(~P)", "f -> F");
    ctx.check_eq(s("true -> P"), "P", "T -> f");
    ctx.check_eq(s("P ^ true"), "(~P)", "f ^ T");
    ctx.check_eq(s("false <-> P"), "(~P)", "F <-> f");
    ctx.check_eq(s("P <-> ~P"), "false", "f <-> ~f");
    ctx.check_eq(s("(P & ~~P) | Q"), "(P | Q)", "rules cascade to a fixpoint");
    ctx.check_eq(s("~(P & Q)"), "(~(P & Q))", "no De Morgan");
}

static void test_simplify_properties(TestContext& ctx) {
    FormulaFactory f;
    for (const std::string& src : corpus()) {
        FormulaId id  = parse_formula(src, f);
        FormulaId s1  = simplify(id, f);
        FormulaId s2  = simplify(s1, f);
        ctx.check(s1 == s2, "idempotent: " + src);
        ctx.check(simplify_once(s1, f) == s1, "fixpoint: " + src);
        ctx.check(node_count(f, s1) <= node_count(f, id), "never grows: " + src);
        ctx.check(is_equivalent(id, s1, f), "equivalence-preserving: " + src);
    }

    FormulaId plain = parse_formula("P & Q", f);
    ctx.check(simplify(plain, f) == plain, "irreducible formula keeps its id");
}

// ============================================================================
// Normal Form Tests
// ============================================================================

static void test_eliminations(TestContext& ctx) {
    ctx.check_eq(pp_with(eliminate_equivalences, "P <-> Q"),
                 "((P & Q) | ((~P) & (~Q)))", "<-> expansion");
    ctx.check_eq(pp_with(eliminate_equivalences, "P ^ Q"),
                 "((P & (~Q)) | ((~P) & Q))", "^ expansion");
    ctx.check_eq(pp_with(eliminate_equivalences, "P -> Q"), "(P -> Q)", "-> untouched");
    ctx.check_eq(pp_with(eliminate_implications, "P -> Q"), "((~P) | Q)", "-> elimination");
    ctx.check_eq(pp_with(eliminate_implications, "P -> Q -> R"),
                 "((~P) | ((~Q) | R))", "nested -> elimination");
}

static void test_nnf(TestContext& ctx) {
    ctx.check_eq(pp_with(to_nnf, "~(P & Q)"), "((~P) | (~Q))", "De Morgan &");
    ctx.check_eq(pp_with(to_nnf, "~(P | ~Q)"), "((~P) & Q)", "De Morgan |");
    ctx.check_eq(pp_with(to_nnf, "~~P"), "P", "double negation");
    ctx.check_eq(pp_with(to_nnf, "~true"), "false", "~T");
    ctx.check_eq(pp_with(to_nnf, "~(P -> Q)"), "(P & (~Q))", "negated implication");
    ctx.check_eq(pp_with(to_nnf, "~(P <-> Q)"),
                 "(((~P) | (~Q)) & (P | Q))", "negated biconditional");
}

static void test_cnf_dnf(TestContext& ctx) {
    FormulaFactory f;
    FormulaId impl = parse_formula("P -> Q", f);
    FormulaId cnf  = to_cnf(impl, f);
    ctx.check(cnf == parse_formula("~P | Q", f), "to_cnf(P -> Q) is ~P | Q");
    ctx.check(!mentions_kind(f, cnf, NodeKind::Implies), "no implication left");

    ctx.check_eq(pp_with(to_cnf, "(P & Q) | R"), "((P | R) & (Q | R))", "| over &");
    ctx.check_eq(pp_with(to_dnf, "(P | Q) & R"), "((P & R) | (Q & R))", "& over |");
    ctx.check_eq(pp_with(to_dnf, "P & (Q | R)"), "((P & Q) | (P & R))", "& over | (right)");
    ctx.check_eq(pp_with(to_cnf, "P | (Q & R)"), "((P | Q) & (P | R))", "| over & (right)");
    ctx.check_eq(pp_with(to_cnf, "true | P"), "(true | P)", "no simplification afterwards");
}

static void test_shape_predicates(TestContext& ctx) {
    FormulaFactory f;
    auto p = [&](const std::string& s) { return parse_formula(s, f); };

    ctx.check(is_literal(f, p("P")) && is_literal(f, p("~P")), "atom and negated atom");
    ctx.check(is_literal(f, p("true")), "constant literal");
    ctx.check(!is_literal(f, p("~~P")) && !is_literal(f, p("P & Q")), "non-literals");

    ctx.check(is_nnf(f, p("~P & (Q | ~R)")), "NNF");
    ctx.check(!is_nnf(f, p("~(P & Q)")), "negated conjunction is not NNF");
    ctx.check(!is_nnf(f, p("P -> Q")), "implication is not NNF");

    ctx.check(is_cnf(f, p("(P | ~Q) & R")), "CNF");
    ctx.check(!is_cnf(f, p("(P & Q) | R")), "DNF shape is not CNF");
    ctx.check(is_dnf(f, p("(P & Q) | R")), "DNF");
    ctx.check(!is_dnf(f, p("(P | Q) & R")), "CNF shape is not DNF");
    ctx.check(is_cnf(f, p("P")) && is_dnf(f, p("P")), "a literal is both");
    ctx.check(is_cnf(f, p("P | Q")) && is_dnf(f, p("P | Q")), "single clause is both");
}

static void test_normal_forms_equivalent(TestContext& ctx) {
    FormulaFactory f;
    for (const std::string& src : corpus()) {
        FormulaId id  = parse_formula(src, f);
        FormulaId nnf = to_nnf(id, f);
        FormulaId cnf = to_cnf(id, f);
        FormulaId dnf = to_dnf(id, f);

        ctx.check(is_nnf(f, nnf), "nnf shape: " + src);
        ctx.check(is_cnf(f, cnf), "cnf shape: " + src);
        ctx.check(is_dnf(f, dnf), "dnf shape: " + src);
        ctx.check(is_equivalent(id, nnf, f), "nnf equivalent: " + src);
        ctx.check(is_equivalent(id, cnf, f), "cnf equivalent: " + src);
        ctx.check(is_equivalent(id, dnf, f), "dnf equivalent: " + src);
        ctx.check(to_cnf(cnf, f) == cnf, "cnf is stable: " + src);
    }
}

// ============================================================================
// Decision Procedure Tests
// ============================================================================

static void test_decision_basic(TestContext& ctx) {
    FormulaFactory f;
    auto p = [&](const std::string& s) { return parse_formula(s, f); };

    ctx.check(is_tautology(p("P | ~P"), f), "P | ~P tautology");
    ctx.check(is_tautology(p("(P & Q) -> P"), f), "(P & Q) -> P tautology");
    ctx.check(!is_tautology(p("P & Q"), f), "P & Q not tautology");
    ctx.check(!is_tautology(p("P"), f), "P not tautology");

    ctx.check(is_contradiction(p("P & ~P"), f), "P & ~P contradiction");
    ctx.check(!is_contradiction(p("(P & Q) -> (R & ~R)"), f), "(P & Q) -> (R & ~R)");
    ctx.check(!is_contradiction(p("P | Q"), f), "P | Q not contradiction");
    ctx.check(!is_contradiction(p("P"), f), "P not contradiction");

    ctx.check(is_satisfiable(p("P & Q"), f), "P & Q satisfiable");
    ctx.check(is_satisfiable(p("P | ~P"), f), "P | ~P satisfiable");
    ctx.check(is_satisfiable(p("P -> Q"), f), "P -> Q satisfiable");
    ctx.check(!is_satisfiable(p("P & ~P"), f), "P & ~P unsatisfiable");

    ctx.check(is_falsifiable(p("P & Q"), f), "P & Q falsifiable");
    ctx.check(!is_falsifiable(p("P | ~P"), f), "P | ~P not falsifiable");
    ctx.check(is_falsifiable(p("P -> Q"), f), "P -> Q falsifiable");
    ctx.check(is_falsifiable(p("P & ~P"), f), "P & ~P falsifiable");

    ctx.check(is_tautology(p("true"), f) && is_contradiction(p("false"), f), "constants");
}

static void test_equivalence(TestContext& ctx) {
    FormulaFactory f;
    auto p = [&](const std::string& s) { return parse_formula(s, f); };

    FormulaId de_morgan   = p("~(phi & psi) <-> (~phi | ~psi)");
    FormulaId implication = p("(phi -> psi) <-> (~phi | psi)");
    ctx.check(is_equivalent(de_morgan, implication, f), "De Morgan identity ≡ implication identity");
    ctx.check(is_equivalent(p("phi -> psi"), p("~phi | psi"), f), "implication sides");
    ctx.check(is_equivalent(p("P <-> Q"), p("(P -> Q) & (Q -> P)"), f), "biconditional");
    ctx.check(is_equivalent(p("P"), p("P"), f), "reflexive");
    ctx.check(is_equivalent(p("P"), p("P & (Q -> Q)"), f), "extra atom");
    ctx.check(!is_equivalent(p("P"), p("P | Q"), f), "P vs P | Q");
    ctx.check(!is_equivalent(p("P"), p("Q"), f), "P vs Q");
    ctx.check(!is_equivalent(p("P | Q"), p("P"), f), "P | Q vs P");
}

static void test_models(TestContext& ctx) {
    FormulaFactory f;
    auto p = [&](const std::string& s) { return parse_formula(s, f); };

    ctx.check_eq(models_to_string(satisfying_assignments(p("P & Q"), f)),
                 "{P=1, Q=1}", "models of P & Q");
    ctx.check_eq(models_to_string(satisfying_assignments(p("P | ~P"), f)),
                 "{P=0} {P=1}", "models of P | ~P");
    ctx.check_eq(models_to_string(satisfying_assignments(p("P -> Q"), f)),
                 "{P=0, Q=0} {P=0, Q=1} {P=1, Q=1}", "models of P -> Q");
    ctx.check_eq(models_to_string(satisfying_assignments(p("P -> ~P"), f)),
                 "{P=0}", "models of P -> ~P");

    ctx.check_eq(models_to_string(falsifying_assignments(p("P & Q"), f)),
                 "{P=0, Q=0} {P=0, Q=1} {P=1, Q=0}", "counter-models of P & Q");
    ctx.check(falsifying_assignments(p("P | ~P"), f).empty(), "no counter-models of P | ~P");
    ctx.check_eq(models_to_string(falsifying_assignments(p("P -> Q"), f)),
                 "{P=1, Q=0}", "counter-models of P -> Q");
    ctx.check_eq(models_to_string(falsifying_assignments(p("P -> ~P"), f)),
                 "{P=1}", "counter-models of P -> ~P");

    auto constant = satisfying_assignments(p("true"), f);
    ctx.check(constant.size() == 1 && constant[0].empty(), "one empty model of true");
}

// ── Data-driven classification suites ────────────────────────────────────────

std::vector<TestCase> generate_identity_tests() {
    const Classification T = Classification::Tautology;
    return {
        { "~~phi <-> phi",                                         T },  // double negation
        { "(phi & phi) <-> phi",                                   T },  // idempotent
        { "(phi | phi) <-> phi",                                   T },
        { "(phi & psi) <-> (psi & phi)",                           T },  // commutative
        { "(phi | psi) <-> (psi | phi)",                           T },
        { "((phi & psi) & chi) <-> (phi & (psi & chi))",           T },  // associative
        { "((phi | psi) | chi) <-> (phi | (psi | chi))",           T },
        { "(phi & (psi | chi)) <-> ((phi & psi) | (phi & chi))",   T },  // distributive
        { "(phi | (psi & chi)) <-> ((phi | psi) & (phi | chi))",   T },
        { "~(phi & psi) <-> (~phi | ~psi)",                        T },  // De Morgan
        { "~(phi | psi) <-> (~phi & ~psi)",                        T },
        { "(phi & (phi | psi)) <-> phi",                           T },  // absorption
        { "(phi | (phi & psi)) <-> phi",                           T },
        { "(phi -> psi) <-> (~phi | psi)",                         T },  // implication
    };
}

std::vector<TestCase> generate_classification_tests() {
    const Classification T = Classification::Tautology;
    const Classification C = Classification::Contradiction;
    const Classification N = Classification::Contingent;
    return {
        { "P | ~P",                                   T },
        { "(P & Q) -> P",                             T },
        { "P -> (Q -> P)",                            T },
        { "(P -> Q) | (Q -> P)",                      T },
        { "((P -> Q) & (Q -> R)) -> (P -> R)",        T },
        { "~(P & ~P)",                                T },
        { "(P ^ Q) <-> ~(P <-> Q)",                   T },
        { "(P -> Q) <-> (~Q -> ~P)",                  T },
        { "true",                                     T },
        { "P & ~P",                                   C },
        { "(P <-> Q) & (P ^ Q)",                      C },
        { "~(P | ~P)",                                C },
        { "(P -> Q) & P & ~Q",                        C },
        { "(P | Q) & ~P & ~Q",                        C },
        { "P ^ P",                                    C },
        { "false",                                    C },
        { "P",                                        N },
        { "P & Q",                                    N },
        { "P -> Q",                                   N },
        { "(P & Q) -> (R & ~R)",                      N },
        { "P <-> ~Q",                                 N },
        { "~(P & (Q | R)) | (S & T)",                 N },
        { "(P & Q & R) | (~P & ~Q & ~R)",             N },
    };
}

static void run_test_vector(TestContext& ctx, const std::vector<TestCase>& tests,
                            const DecisionOptions& opts) {
    for (std::size_t i = 0; i < tests.size(); ++i) {
        const auto& tc = tests[i];
        try {
            FormulaFactory f;
            FormulaId id = parse_formula(tc.formula, f);
            Classification got = classify(id, f, opts);
            ctx.check(got == tc.expected,
                      "Test " + std::to_string(i + 1) + ": " + tc.formula +
                      " expected " + classification_name(tc.expected) +
                      " got " + classification_name(got));
        } catch (const std::exception& e) {
            ctx.check(false, "Test " + std::to_string(i + 1) + ": " + tc.formula +
                             " threw: " + std::string(e.what()));
        }
    }
}

static void test_identity_suite(TestContext& ctx) {
    run_test_vector(ctx, generate_identity_tests(), DecisionOptions{});
}

static void test_classification_suite(TestContext& ctx) {
    run_test_vector(ctx, generate_classification_tests(), DecisionOptions{});
}

// ============================================================================
// Truth Table Tests
// ============================================================================

static void test_truth_table(TestContext& ctx) {
    FormulaFactory f;

    TruthTable excluded = get_truth_table(parse_formula("P | ~P", f), f);
    ctx.check(excluded.rows.size() == 2, "P | ~P has two rows");
    ctx.check(excluded.rows.size() == 2 && excluded.rows[0].result && excluded.rows[1].result,
              "both rows true");
    ctx.check(excluded.rows.size() == 2 && !excluded.rows[0].values[0] &&
              excluded.rows[1].values[0], "false row first");

    TruthTable conj = get_truth_table(parse_formula("Q & P", f), f);
    ctx.check_eq(join(conj.atoms), "P Q", "atoms sorted");
    ctx.check_eq(conj.assignment(1).to_string(), "{P=0, Q=1}", "first atom varies slowest");
    ctx.check_eq(conj.to_string(),
                 "P | Q | result\n"
                 "--+---+-------\n"
                 "0 | 0 | 0\n"
                 "0 | 1 | 0\n"
                 "1 | 0 | 0\n"
                 "1 | 1 | 1\n",
                 "rendered table");

    ctx.check_throws<std::out_of_range>([&] { conj.assignment(4); }, "row index checked");

    TruthTable constant = get_truth_table(f.make_true(), f);
    ctx.check(constant.atoms.empty() && constant.rows.size() == 1 && constant.rows[0].result,
              "constant has one row");
    ctx.check(constant.assignment(0).empty(), "empty assignment for a constant");

    FormulaId wide63 = wide_formula(f, 63, NodeKind::Or);
    FormulaId wide64 = wide_formula(f, 64, NodeKind::And);
    ctx.check_throws<std::length_error>([&] { get_truth_table(wide63, f); },
                                        "63 atoms cannot be tabulated");
    ctx.check_throws<std::length_error>([&] { get_truth_table(wide64, f); },
                                        "64 atoms cannot be tabulated");
}

static void test_truth_table_properties(TestContext& ctx) {
    FormulaFactory f;
    for (const std::string& src : corpus()) {
        FormulaId id = parse_formula(src, f);
        TruthTable table = get_truth_table(id, f);

        std::vector<std::string> atoms = get_atoms(f, id);
        ctx.check(std::set<std::string>(atoms.begin(), atoms.end()) ==
                  std::set<std::string>(table.atoms.begin(), table.atoms.end()),
                  "table atoms are the formula's atoms: " + src);
        ctx.check(table.rows.size() == (std::size_t{1} << atoms.size()), "2^n rows: " + src);

        bool rows_agree = true;
        bool any_false  = false;
        for (std::size_t r = 0; r < table.rows.size(); ++r) {
            FormulaId v = evaluate(id, table.assignment(r), f);
            rows_agree = rows_agree && v == f.make_constant(table.rows[r].result);
            any_false  = any_false || !table.rows[r].result;
        }
        ctx.check(rows_agree, "rows agree with evaluate: " + src);
        ctx.check(is_tautology(id, f) == !any_false, "tautology iff no false row: " + src);
    }
}

// ============================================================================
// Backend and Parallelism Tests
// ============================================================================

static void test_z3_checker(TestContext& ctx) {
    FormulaFactory f;
    Z3Checker checker(f);
    checker.add_formula(parse_formula("(P ^ Q) & Q", f));
    ctx.check(checker.check() == Z3Result::SAT, "satisfiable");
    auto model = checker.get_model({"P", "Q"});
    ctx.check(model && model->to_string() == "{P=0, Q=1}", "the only model");

    checker.block(*model);
    ctx.check(checker.check() == Z3Result::UNSAT, "blocking the only model");
    ctx.check(!checker.get_model({"P", "Q"}).has_value(), "no model after UNSAT");

    checker.reset();
    checker.add_formula(parse_formula("P | ~P", f), false);
    ctx.check(checker.check() == Z3Result::UNSAT, "negated tautology");
}

static void test_z3_agreement(TestContext& ctx) {
    DecisionOptions table_opts;
    DecisionOptions z3_opts;
    z3_opts.backend = Backend::Z3;

    FormulaFactory f;
    for (const std::string& src : corpus()) {
        FormulaId id = parse_formula(src, f);
        ctx.check(classify(id, f, table_opts) == classify(id, f, z3_opts), "classify: " + src);
        ctx.check(satisfying_assignments(id, f, table_opts) ==
                  satisfying_assignments(id, f, z3_opts), "models: " + src);
        ctx.check(falsifying_assignments(id, f, table_opts) ==
                  falsifying_assignments(id, f, z3_opts), "counter-models: " + src);
        FormulaId cnf = to_cnf(id, f);
        ctx.check(is_equivalent(id, cnf, f, z3_opts), "z3 equivalence: " + src);
    }
    run_test_vector(ctx, generate_identity_tests(), z3_opts);
    run_test_vector(ctx, generate_classification_tests(), z3_opts);

    FormulaId p = parse_formula("P", f);
    ctx.check(!is_equivalent(p, parse_formula("P | Q", f), f, z3_opts), "z3 non-equivalence");
}

static void test_wide_formulas(TestContext& ctx) {
    // Past the table limit formulas go to Z3 whatever the requested backend.
    FormulaFactory f;
    FormulaId conj = wide_formula(f, 70, NodeKind::And);
    ctx.check(is_satisfiable(conj, f), "wide conjunction satisfiable");
    ctx.check(classify(conj, f) == Classification::Contingent, "wide conjunction contingent");

    auto models = satisfying_assignments(conj, f);
    bool all_true = models.size() == 1 && models[0].size() == 70;
    if (all_true) {
        for (const auto& [name, value] : models[0].values()) all_true = all_true && value;
    }
    ctx.check(all_true, "single all-true model");

    FormulaId taut = f.make_or(wide_formula(f, 64, NodeKind::Or),
                               f.make_not(f.make_atom("x0")));
    ctx.check(is_tautology(taut, f), "wide tautology");
    ctx.check(is_equivalent(conj, f.make_and(conj, conj), f), "wide equivalence");
}

static void test_enumeration_limit(TestContext& ctx) {
    FormulaFactory f;

    // Ask for the widest table possible; 63 atoms must still reach Z3.
    DecisionOptions widest;
    widest.table_atom_limit = 1000;

    FormulaId d63 = wide_formula(f, 63, NodeKind::Or);
    ctx.check(is_satisfiable(d63, f, widest), "63-atom disjunction satisfiable");
    ctx.check(!is_contradiction(d63, f, widest), "63-atom disjunction not a contradiction");
    ctx.check(!is_tautology(f.make_not(d63), f, widest), "its negation is no tautology");
    ctx.check(classify(d63, f, widest) == Classification::Contingent, "63-atom contingent");
    ctx.check(!is_equivalent(d63, f.make_false(), f, widest), "63-atom not equivalent to false");
    ctx.check(is_equivalent(d63, f.make_or(d63, f.make_atom("x5")), f, widest),
              "63-atom absorbs a repeated atom");

    auto counter = falsifying_assignments(d63, f, widest);
    bool all_false = counter.size() == 1 && counter[0].size() == 63;
    if (all_false) {
        for (const auto& [name, value] : counter[0].values()) all_false = all_false && !value;
    }
    ctx.check(all_false, "single all-false counter-model");

    // The default hand-over keeps wide tautology checks off the table.
    ctx.check(DecisionOptions{}.table_atom_limit == kDefaultTableAtomLimit, "default limit");
    FormulaId d40  = wide_formula(f, 40, NodeKind::Or);
    FormulaId t40  = f.make_or(d40, f.make_not(f.make_atom("x39")));
    ctx.check(is_tautology(t40, f), "40-atom tautology");
    ctx.check(classify(d40, f) == Classification::Contingent, "40-atom contingent");

    // Either side of the hand-over gives the same answers.
    DecisionOptions table_only;
    table_only.table_atom_limit = kMaxEnumeratedAtoms;
    DecisionOptions z3_only;
    z3_only.table_atom_limit = 0;
    FormulaId mixed = f.make_or(wide_formula(f, 8, NodeKind::Or),
                                f.make_iff(f.make_atom("x8"), f.make_atom("x9")));
    ctx.check(classify(mixed, f, table_only) == classify(mixed, f, z3_only), "classify agrees");
    auto from_table = falsifying_assignments(mixed, f, table_only);
    ctx.check(from_table.size() == 2, "two counter-models");
    ctx.check(from_table == falsifying_assignments(mixed, f, z3_only), "counter-models agree");
}

static void test_parallel_equivalence(TestContext& ctx) {
    DecisionOptions seq;
    seq.num_threads = 1;
    DecisionOptions par;
    par.num_threads = 4;

    FormulaFactory f;
    std::vector<std::string> sources = corpus();
    sources.push_back("(A ^ B ^ C ^ D ^ E ^ F ^ G ^ H ^ I ^ J ^ K ^ L ^ M ^ N) | (A & ~A)");
    sources.push_back("(A | B | C | D | E | F | G | H | I | J | K | L | M | N) -> (O & ~O)");

    for (const std::string& src : sources) {
        FormulaId id = parse_formula(src, f);
        ctx.check(classify(id, f, seq) == classify(id, f, par), "classify: " + src);
        ctx.check(satisfying_assignments(id, f, seq) == satisfying_assignments(id, f, par),
                  "models: " + src);

        TruthTable t1 = get_truth_table(id, f, 1);
        TruthTable t2 = get_truth_table(id, f, 4);
        bool same = t1.atoms == t2.atoms && t1.rows.size() == t2.rows.size();
        for (std::size_t r = 0; same && r < t1.rows.size(); ++r) {
            same = t1.rows[r].values == t2.rows[r].values && t1.rows[r].result == t2.rows[r].result;
        }
        ctx.check(same, "truth table: " + src);
    }
}

// ============================================================================
// Printer and CLI Tests
// ============================================================================

static void test_printer(TestContext& ctx) {
    FormulaFactory f;
    auto fmt = [&](const std::string& s, const SymbolTable& t = SymbolTable::ascii()) {
        return format_formula(f, parse_formula(s, f), t);
    };

    ctx.check_eq(fmt("P & (Q -> R)"), "P & (Q -> R)", "needed parentheses kept");
    ctx.check_eq(fmt("((P & Q) & R)"), "P & Q & R", "left-assoc chain");
    ctx.check_eq(fmt("P & (Q & R)"), "P & (Q & R)", "right-nested conjunction");
    ctx.check_eq(fmt("P -> (Q -> R)"), "P -> Q -> R", "right-assoc chain");
    ctx.check_eq(fmt("(P -> Q) -> R"), "(P -> Q) -> R", "left-nested implication");
    ctx.check_eq(fmt("~(P | Q)"), "~(P | Q)", "negated group");
    ctx.check_eq(fmt("~~P"), "~~P", "double negation");
    ctx.check_eq(fmt("(P | Q) & ~R"), "(P | Q) & ~R", "lower precedence operand");
    ctx.check_eq(fmt("P ^ (Q <-> R)"), "P ^ (Q <-> R)", "same level on the right");

    ctx.check_eq(fmt("~P & Q", SymbolTable::unicode()), "\xC2\xACP \xE2\x88\xA7 Q", "unicode");
    ctx.check_eq(fmt("~P & Q | true", SymbolTable::words()), "not P and Q or true", "words");

    SymbolTable custom;
    custom.conjunction = "AND";
    ctx.check_eq(fmt("P & Q", custom), "P AND Q", "custom symbol");
    ctx.check(!SymbolTable::by_name("latex").has_value(), "unknown preset");
}

static void test_printer_round_trip(TestContext& ctx) {
    FormulaFactory f;
    const SymbolTable tables[] = {SymbolTable::ascii(), SymbolTable::unicode(),
                                  SymbolTable::words()};
    for (const std::string& src : corpus()) {
        FormulaId id = parse_formula(src, f);
        for (const SymbolTable& t : tables) {
            std::string text = format_formula(f, id, t);
            ParseResult back = try_parse(text, f);
            ctx.check(back.ok() && back.formula == id, "round trip: " + src + " as " + text);
        }
    }
}

static void test_utils(TestContext& ctx) {
    ctx.check_eq(strip_comment("  P & Q  # note"), "P & Q", "strip_comment");
    ctx.check(is_blank_or_comment("   # only a comment"), "comment line");
    ctx.check_eq(join(split("a, b ,c", ',')), "a b c", "split");

    ctx.check_eq(parse_assignment("P=1, Q=false,R=T").to_string(), "{P=1, Q=0, R=1}",
                 "parse_assignment");
    ctx.check(parse_assignment("").empty(), "empty assignment");

    auto rejects = [](const std::string& s) {
        try {
            parse_assignment(s);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    ctx.check(rejects("P"), "missing value");
    ctx.check(rejects("P=2"), "bad value");
    ctx.check(rejects("P=1,P=0"), "duplicate atom");
    ctx.check(rejects("1P=1"), "bad atom name");
}

static void test_cli_args(TestContext& ctx) {
    auto parse = [](std::vector<std::string> args) {
        args.insert(args.begin(), "proplogic");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        return parse_args(static_cast<int>(argv.size()), argv.data());
    };

    Options def = parse({"P & Q"});
    ctx.check(def.actions.size() == 1 && def.actions[0] == Action::Classify, "default action");
    ctx.check(def.input == "P & Q", "formula input");

    Options o = parse({"--cnf", "--eval", "P=1", "--backend", "z3", "--symbols", "words",
                       "-j", "2", "--stats", "P | Q"});
    ctx.check(o.actions.size() == 2 && o.actions[0] == Action::Cnf &&
              o.actions[1] == Action::Eval, "actions in order");
    ctx.check(o.assignment == "P=1", "assignment argument");
    ctx.check(o.decision.backend == Backend::Z3, "backend");
    ctx.check(o.symbols.conjunction == "and", "symbols");
    ctx.check(o.decision.num_threads == 2 && o.show_stats, "threads and stats");

    auto rejects = [&](std::vector<std::string> args) {
        try {
            parse(std::move(args));
        } catch (const std::exception&) {
            return true;
        }
        return false;
    };
    ctx.check(rejects({}), "no input");
    ctx.check(rejects({"--backend", "bdd", "P"}), "unknown backend");
    ctx.check(rejects({"--frobnicate", "P"}), "unknown option");
    ctx.check(rejects({"P", "Q"}), "two inputs");
    ctx.check(!rejects({"--selftest"}), "selftest needs no input");

    Options limited = parse({"--table-limit", "30", "P"});
    ctx.check(limited.decision.table_atom_limit == 30, "table limit");
    ctx.check(rejects({"--table-limit", "-1", "P"}), "negative table limit");

    try {
        parse({"--threads", "abc", "P"});
        ctx.check(false, "non-numeric thread count should be rejected");
    } catch (const std::runtime_error& e) {
        ctx.check_eq(e.what(), "--threads requires a number, got 'abc'", "thread count message");
    }
    ctx.check(rejects({"-j", "4x", "P"}), "trailing junk in thread count");
    ctx.check(rejects({"-j", "99999999999", "P"}), "thread count out of range");
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Lexer
    runner.run("lexer_ascii_connectives",    test_lexer_ascii_connectives);
    runner.run("lexer_unicode_connectives",  test_lexer_unicode_connectives);
    runner.run("lexer_word_connectives",     test_lexer_word_connectives);
    runner.run("lexer_positions",            test_lexer_positions);
    runner.run("lexer_errors",               test_lexer_errors);
    runner.run("lexer_custom_syntax",        test_lexer_custom_syntax);

    // Parser
    runner.run("parse_basic",                test_parse_basic);
    runner.run("parse_precedence",           test_parse_precedence);
    runner.run("parse_associativity",        test_parse_associativity);
    runner.run("parse_errors",               test_parse_errors);
    runner.run("parse_nesting_limit",        test_parse_nesting_limit);
    runner.run("parse_chain_limit",          test_parse_chain_limit);
    runner.run("try_parse",                  test_try_parse);

    // Formula tree and traversal
    runner.run("interning",                  test_interning);
    runner.run("atom_names",                 test_atom_names);
    runner.run("atoms",                      test_atoms);
    runner.run("subformulas",                test_subformulas);
    runner.run("substitute",                 test_substitute);
    runner.run("size_queries",               test_size_queries);

    // Evaluator
    runner.run("interpretation",             test_interpretation);
    runner.run("evaluate_total",             test_evaluate_total);
    runner.run("evaluate_partial",           test_evaluate_partial);
    runner.run("evaluate_unbound",           test_evaluate_unbound);
    runner.run("row_evaluator",              test_row_evaluator);

    // Simplifier
    runner.run("simplify_rules",             test_simplify_rules);
    runner.run("simplify_properties",        test_simplify_properties);

    // Normal forms
    runner.run("eliminations",               test_eliminations);
    runner.run("nnf",                        test_nnf);
    runner.run("cnf_dnf",                    test_cnf_dnf);
    runner.run("shape_predicates",           test_shape_predicates);
    runner.run("normal_forms_equivalent",    test_normal_forms_equivalent);

    // Decision procedures
    runner.run("decision_basic",             test_decision_basic);
    runner.run("equivalence",                test_equivalence);
    runner.run("models",                     test_models);
    runner.run("identity_suite",             test_identity_suite);
    runner.run("classification_suite",       test_classification_suite);

    // Truth tables
    runner.run("truth_table",                test_truth_table);
    runner.run("truth_table_properties",     test_truth_table_properties);

    // Backends and parallelism
    runner.run("z3_checker",                 test_z3_checker);
    runner.run("z3_agreement",               test_z3_agreement);
    runner.run("wide_formulas",              test_wide_formulas);
    runner.run("enumeration_limit",          test_enumeration_limit);
    runner.run("parallel_equivalence",       test_parallel_equivalence);

    // Printer and CLI
    runner.run("printer",                    test_printer);
    runner.run("printer_round_trip",         test_printer_round_trip);
    runner.run("utils",                      test_utils);
    runner.run("cli_args",                   test_cli_args);

    return runner.summarise();
}

}  // namespace proplogic
