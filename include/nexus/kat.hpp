#pragma once

// nexus/kat.hpp: Kleene Algebra with Tests: expressions, ε-NFA, DFA.
//
// DESIGN:
//   Expressions are immutable trees shared through ExprPtr. to_enfa() is a
//   Thompson construction (one fresh start/accept pair per node); determinize()
//   is the classical subset construction. Tests are opaque labels to the
//   automata: a word is a sequence of Labels, and a Test label matches only a
//   structurally equal test expression.
//
// INVARIANT:
//   Labels are totally ordered (every Action sorts before every Test; symbols
//   by byte order; test expressions structurally). DFA transitions out of a
//   state are sorted by label and carry pairwise distinct labels.
//
// SERIALIZATION (DFA_SERIALIZATION_VERSION = 1):
//   le_u32(state_count) || le_u32(start)
//   || for each state: accepting(1B) || le_u32(transition_count)
//                      || for each transition: le_u32(target) || symbol_bytes
//   symbol_bytes come from the caller-supplied SymbolEncoder.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nexus/types.hpp"

namespace nexus::kat {

// ---------------------------------------------------------------------------
// Test expressions
// ---------------------------------------------------------------------------
enum class TestKind {
  zero,
  one,
  atom,
  negation,
  conjunction,
  disjunction,
};

struct TestExpr;
using TestPtr = std::shared_ptr<const TestExpr>;

struct TestExpr {
  TestKind kind{TestKind::zero};
  std::string symbol;  // atom only
  TestPtr lhs;         // negation operand, or left of and/or
  TestPtr rhs;
};

TestExpr tfalse();
TestExpr ttrue();
TestExpr atom(std::string symbol);
TestExpr tnot(TestExpr inner);
TestExpr tand(TestExpr lhs, TestExpr rhs);
TestExpr tor(TestExpr lhs, TestExpr rhs);

// Structural three-way comparison; kinds order as declared in TestKind.
int compare(const TestExpr& a, const TestExpr& b);
bool operator==(const TestExpr& a, const TestExpr& b);
bool operator<(const TestExpr& a, const TestExpr& b);
std::string to_string(const TestExpr& t);

// ---------------------------------------------------------------------------
// KAT expressions
// ---------------------------------------------------------------------------
enum class ExprKind {
  zero,
  one,
  action,
  test,
  sequence,
  choice,
  star,
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct Expr {
  ExprKind kind{ExprKind::zero};
  std::string symbol;  // action
  TestExpr test;       // test
  ExprPtr lhs;         // sequence, choice, star (operand)
  ExprPtr rhs;         // sequence, choice
};

ExprPtr zero();
ExprPtr one();
ExprPtr action(std::string symbol);
ExprPtr test(TestExpr t);
ExprPtr seq(ExprPtr lhs, ExprPtr rhs);
ExprPtr choice(ExprPtr lhs, ExprPtr rhs);
ExprPtr star(ExprPtr inner);

bool operator==(const Expr& a, const Expr& b);
std::string to_string(const Expr& e);

// ---------------------------------------------------------------------------
// Labels
// ---------------------------------------------------------------------------
enum class LabelKind { action, test };

struct Label {
  LabelKind kind{LabelKind::action};
  std::string symbol;  // action
  TestExpr test;       // test

  static Label make_action(std::string symbol);
  static Label make_test(TestExpr t);
};

int compare(const Label& a, const Label& b);
bool operator==(const Label& a, const Label& b);
bool operator<(const Label& a, const Label& b);
std::string to_string(const Label& l);

// ---------------------------------------------------------------------------
// ε-NFA
// ---------------------------------------------------------------------------
struct EnfaTransition {
  std::size_t from{0};
  std::size_t to{0};
  std::optional<Label> label;  // nullopt = ε-move

  bool is_epsilon() const { return !label.has_value(); }
};

struct Enfa {
  std::size_t state_count{0};
  std::size_t start{0};
  std::set<std::size_t> accepting;
  std::vector<EnfaTransition> transitions;

  std::set<std::size_t> epsilon_closure(const std::set<std::size_t>& seeds) const;
  bool accepts(const std::vector<Label>& word) const;
};

Enfa to_enfa(const Expr& expr);

// ---------------------------------------------------------------------------
// DFA
// ---------------------------------------------------------------------------
struct DfaTransition {
  Label label;
  std::size_t to{0};
};

struct DfaState {
  std::vector<DfaTransition> transitions;
};

struct Dfa {
  std::vector<DfaState> states;
  std::size_t start{0};
  std::set<std::size_t> accepting;

  bool is_accepting(std::size_t state) const { return accepting.count(state) != 0; }
  std::optional<std::size_t> step(std::size_t state, const Label& label) const;
  bool accepts(const std::vector<Label>& word) const;
  std::size_t max_out_degree() const;
};

Dfa determinize(const Enfa& enfa);
Dfa compile(const Expr& expr);

// Returns the bytes that stand for `label`, or nullopt if it has none.
using SymbolEncoder = std::function<std::optional<std::string>(const Label&)>;

std::optional<std::string> serialize_dfa(const Dfa& dfa, const SymbolEncoder& symbol_of, Error* error = nullptr);

// BLAKE3 domain hash ("nexus.dfa:") of a canonical text rendering.
std::string dfa_fingerprint(const Dfa& dfa);

// ---------------------------------------------------------------------------
// Text syntax
// ---------------------------------------------------------------------------
//   expr    := concat ('+' concat)*
//   concat  := unary ((';')? unary)*          juxtaposition also sequences
//   unary   := primary '*'*
//   primary := ACTION | test | '0' | '1' | '(' expr ')'
//   test    := disj;  disj := conj ('|' conj)*;  conj := neg ('&' neg)*
//   neg     := '!' neg | TEST | '0' | '1' | '(' test ')'
// Inside parentheses opened by a test, '+' also means disjunction.
class ParserConfig {
 public:
  // Fails with kat_parse_error when a symbol is declared both ways.
  static std::optional<ParserConfig> make(const std::vector<std::string>& actions,
                                          const std::vector<std::string>& tests, Error* error = nullptr);

  bool is_action(const std::string& s) const { return actions_.count(s) != 0; }
  bool is_test(const std::string& s) const { return tests_.count(s) != 0; }

 private:
  std::set<std::string> actions_;
  std::set<std::string> tests_;
};

std::optional<ExprPtr> parse_kat(const std::string& text, const ParserConfig& config, Error* error = nullptr);

}  // namespace nexus::kat
