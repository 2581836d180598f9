// ============================================================================
// proplogic/test.hpp — Lightweight selftest framework
// ============================================================================
//
// Built-in harness behind `proplogic --selftest`.  Each test is a function
// taking a TestContext; run_selftests() hands them to a TestRunner, which
// runs them in order and prints a summary.
//
//   static void test_precedence(TestContext& ctx) {
//       ctx.check_eq(pp("P | Q & R"), "(P | (Q & R))", "& binds tighter");
//       ctx.check_throws<SyntaxError>([] { tokenise("P $ Q"); }, "stray '$'");
//   }
//
// ============================================================================

#ifndef PROPLOGIC_TEST_HPP
#define PROPLOGIC_TEST_HPP

#include "proplogic/decision.hpp"

#include <functional>
#include <string>
#include <vector>

namespace proplogic {

// ── TestContext ──────────────────────────────────────────────────────────────

class TestContext {
public:
    /// Record a check.  If `condition` is false, logs a failure.
    void check(bool condition, const std::string& description);

    /// Record a string-equality check with nice diff output.
    void check_eq(const std::string& actual, const std::string& expected,
                  const std::string& description);

    /// Passes when `fn` throws `Error`.  Any other exception propagates to
    /// the runner and fails the test.
    template <typename Error, typename Fn>
    void check_throws(Fn&& fn, const std::string& description) {
        bool threw = false;
        try {
            fn();
        } catch (const Error&) {
            threw = true;
        }
        check(threw, description + " (expected exception)");
    }

    /// Total checks so far.
    int total() const noexcept { return total_; }

    /// Failed checks so far.
    int failed() const noexcept { return failed_; }

private:
    int total_  = 0;
    int failed_ = 0;
    std::string current_test_;

    friend class TestRunner;
};

// ── TestRunner ──────────────────────────────────────────────────────────────

class TestRunner {
public:
    using TestFunc = std::function<void(TestContext&)>;

    /// Register and immediately run a named test.
    void run(const std::string& name, TestFunc func);

    /// Print summary and return exit code (0 = all pass, 1 = failures).
    int summarise() const;

private:
    int tests_run_    = 0;
    int tests_failed_ = 0;
    int checks_total_ = 0;
    int checks_failed_ = 0;
};

// ── TestCase — data-driven classification test ──────────────────────────────

struct TestCase {
    std::string    formula;
    Classification expected;
};

/// The algebraic identities (double negation, idempotence, commutativity,
/// associativity, distributivity, De Morgan, absorption, implication) over
/// the atoms phi, psi and chi.  All of them are tautologies.
std::vector<TestCase> generate_identity_tests();

/// Mixed tautologies, contradictions and contingent formulas.
std::vector<TestCase> generate_classification_tests();

/// Entry point: run all built-in self-tests.
/// Returns 0 on success, 1 on failure.
int run_selftests();

}  // namespace proplogic

#endif  // PROPLOGIC_TEST_HPP
