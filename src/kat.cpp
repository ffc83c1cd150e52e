#include "nexus/kat.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <map>
#include <sstream>
#include <utility>

#include "nexus/hash.hpp"
#include "nexus/observability.hpp"

namespace nexus::kat {
namespace {

int compare_strings(const std::string& a, const std::string& b) {
  const int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

TestPtr share(TestExpr t) { return std::make_shared<const TestExpr>(std::move(t)); }

ExprPtr make_expr(Expr e) { return std::make_shared<const Expr>(std::move(e)); }

void append_le_u32(std::string& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out += static_cast<char>((v >> (8 * i)) & 0xFF);
}

}  // namespace

// ---------------------------------------------------------------------------
// Test expressions
// ---------------------------------------------------------------------------

TestExpr tfalse() { return TestExpr{TestKind::zero, {}, nullptr, nullptr}; }
TestExpr ttrue() { return TestExpr{TestKind::one, {}, nullptr, nullptr}; }
TestExpr atom(std::string symbol) { return TestExpr{TestKind::atom, std::move(symbol), nullptr, nullptr}; }
TestExpr tnot(TestExpr inner) { return TestExpr{TestKind::negation, {}, share(std::move(inner)), nullptr}; }

TestExpr tand(TestExpr lhs, TestExpr rhs) {
  return TestExpr{TestKind::conjunction, {}, share(std::move(lhs)), share(std::move(rhs))};
}

TestExpr tor(TestExpr lhs, TestExpr rhs) {
  return TestExpr{TestKind::disjunction, {}, share(std::move(lhs)), share(std::move(rhs))};
}

int compare(const TestExpr& a, const TestExpr& b) {
  if (a.kind != b.kind) return a.kind < b.kind ? -1 : 1;
  switch (a.kind) {
    case TestKind::zero:
    case TestKind::one:
      return 0;
    case TestKind::atom:
      return compare_strings(a.symbol, b.symbol);
    case TestKind::negation:
      return compare(*a.lhs, *b.lhs);
    case TestKind::conjunction:
    case TestKind::disjunction: {
      const int c = compare(*a.lhs, *b.lhs);
      return c != 0 ? c : compare(*a.rhs, *b.rhs);
    }
  }
  return 0;
}

bool operator==(const TestExpr& a, const TestExpr& b) { return compare(a, b) == 0; }
bool operator<(const TestExpr& a, const TestExpr& b) { return compare(a, b) < 0; }

std::string to_string(const TestExpr& t) {
  switch (t.kind) {
    case TestKind::zero: return "0";
    case TestKind::one: return "1";
    case TestKind::atom: return t.symbol;
    case TestKind::negation: return "!" + to_string(*t.lhs);
    case TestKind::conjunction: return "(" + to_string(*t.lhs) + " & " + to_string(*t.rhs) + ")";
    case TestKind::disjunction: return "(" + to_string(*t.lhs) + " | " + to_string(*t.rhs) + ")";
  }
  return "?";
}

// ---------------------------------------------------------------------------
// KAT expressions
// ---------------------------------------------------------------------------

ExprPtr zero() { return make_expr(Expr{ExprKind::zero, {}, {}, nullptr, nullptr}); }
ExprPtr one() { return make_expr(Expr{ExprKind::one, {}, {}, nullptr, nullptr}); }
ExprPtr action(std::string symbol) { return make_expr(Expr{ExprKind::action, std::move(symbol), {}, nullptr, nullptr}); }
ExprPtr test(TestExpr t) { return make_expr(Expr{ExprKind::test, {}, std::move(t), nullptr, nullptr}); }

ExprPtr seq(ExprPtr lhs, ExprPtr rhs) {
  return make_expr(Expr{ExprKind::sequence, {}, {}, std::move(lhs), std::move(rhs)});
}

ExprPtr choice(ExprPtr lhs, ExprPtr rhs) {
  return make_expr(Expr{ExprKind::choice, {}, {}, std::move(lhs), std::move(rhs)});
}

ExprPtr star(ExprPtr inner) { return make_expr(Expr{ExprKind::star, {}, {}, std::move(inner), nullptr}); }

bool operator==(const Expr& a, const Expr& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case ExprKind::zero:
    case ExprKind::one:
      return true;
    case ExprKind::action:
      return a.symbol == b.symbol;
    case ExprKind::test:
      return a.test == b.test;
    case ExprKind::star:
      return *a.lhs == *b.lhs;
    case ExprKind::sequence:
    case ExprKind::choice:
      return *a.lhs == *b.lhs && *a.rhs == *b.rhs;
  }
  return false;
}

std::string to_string(const Expr& e) {
  switch (e.kind) {
    case ExprKind::zero: return "0";
    case ExprKind::one: return "1";
    case ExprKind::action: return e.symbol;
    case ExprKind::test: return to_string(e.test);
    case ExprKind::sequence: return "(" + to_string(*e.lhs) + " ; " + to_string(*e.rhs) + ")";
    case ExprKind::choice: return "(" + to_string(*e.lhs) + " + " + to_string(*e.rhs) + ")";
    case ExprKind::star: return "(" + to_string(*e.lhs) + ")*";
  }
  return "?";
}

// ---------------------------------------------------------------------------
// Labels
// ---------------------------------------------------------------------------

Label Label::make_action(std::string symbol) { return Label{LabelKind::action, std::move(symbol), {}}; }
Label Label::make_test(TestExpr t) { return Label{LabelKind::test, {}, std::move(t)}; }

int compare(const Label& a, const Label& b) {
  if (a.kind != b.kind) return a.kind == LabelKind::action ? -1 : 1;
  return a.kind == LabelKind::action ? compare_strings(a.symbol, b.symbol) : compare(a.test, b.test);
}

bool operator==(const Label& a, const Label& b) { return compare(a, b) == 0; }
bool operator<(const Label& a, const Label& b) { return compare(a, b) < 0; }

std::string to_string(const Label& l) {
  return l.kind == LabelKind::action ? "Action(" + l.symbol + ")" : "Test(" + to_string(l.test) + ")";
}

// ---------------------------------------------------------------------------
// Thompson construction
// ---------------------------------------------------------------------------
namespace {

struct Fragment {
  std::size_t start;
  std::size_t accept;
};

class EnfaBuilder {
 public:
  Fragment build(const Expr& e) {
    switch (e.kind) {
      case ExprKind::zero:
        return fresh();
      case ExprKind::one: {
        Fragment f = fresh();
        epsilon(f.start, f.accept);
        return f;
      }
      case ExprKind::action: {
        Fragment f = fresh();
        consume(f.start, f.accept, Label::make_action(e.symbol));
        return f;
      }
      case ExprKind::test: {
        Fragment f = fresh();
        consume(f.start, f.accept, Label::make_test(e.test));
        return f;
      }
      case ExprKind::sequence: {
        const Fragment l = build(*e.lhs);
        const Fragment r = build(*e.rhs);
        epsilon(l.accept, r.start);
        return Fragment{l.start, r.accept};
      }
      case ExprKind::choice: {
        const Fragment l = build(*e.lhs);
        const Fragment r = build(*e.rhs);
        Fragment f = fresh();
        epsilon(f.start, l.start);
        epsilon(f.start, r.start);
        epsilon(l.accept, f.accept);
        epsilon(r.accept, f.accept);
        return f;
      }
      case ExprKind::star: {
        const Fragment inner = build(*e.lhs);
        Fragment f = fresh();
        epsilon(f.start, inner.start);
        epsilon(f.start, f.accept);
        epsilon(inner.accept, inner.start);
        epsilon(inner.accept, f.accept);
        return f;
      }
    }
    return fresh();
  }

  Enfa finish(const Fragment& top) {
    Enfa out;
    out.state_count = next_;
    out.start = top.start;
    out.accepting.insert(top.accept);
    out.transitions = std::move(transitions_);
    return out;
  }

 private:
  Fragment fresh() {
    const std::size_t s = next_++;
    const std::size_t a = next_++;
    return Fragment{s, a};
  }
  void epsilon(std::size_t from, std::size_t to) { transitions_.push_back(EnfaTransition{from, to, std::nullopt}); }
  void consume(std::size_t from, std::size_t to, Label label) {
    transitions_.push_back(EnfaTransition{from, to, std::move(label)});
  }

  std::size_t next_{0};
  std::vector<EnfaTransition> transitions_;
};

}  // namespace

Enfa to_enfa(const Expr& expr) {
  EnfaBuilder b;
  const Fragment top = b.build(expr);
  return b.finish(top);
}

std::set<std::size_t> Enfa::epsilon_closure(const std::set<std::size_t>& seeds) const {
  std::set<std::size_t> closure = seeds;
  std::vector<std::size_t> stack(seeds.begin(), seeds.end());
  while (!stack.empty()) {
    const std::size_t s = stack.back();
    stack.pop_back();
    for (const auto& t : transitions) {
      if (t.from == s && t.is_epsilon() && closure.insert(t.to).second) stack.push_back(t.to);
    }
  }
  return closure;
}

bool Enfa::accepts(const std::vector<Label>& word) const {
  std::set<std::size_t> current = epsilon_closure({start});
  for (const auto& symbol : word) {
    std::set<std::size_t> next;
    for (const auto& t : transitions) {
      if (!t.is_epsilon() && current.count(t.from) && *t.label == symbol) next.insert(t.to);
    }
    if (next.empty()) return false;
    current = epsilon_closure(next);
  }
  return std::any_of(current.begin(), current.end(), [&](std::size_t s) { return accepting.count(s) != 0; });
}

// ---------------------------------------------------------------------------
// Subset construction
// ---------------------------------------------------------------------------

Dfa determinize(const Enfa& enfa) {
  using Subset = std::set<std::size_t>;
  std::vector<std::vector<std::size_t>> eps(enfa.state_count);
  std::vector<std::vector<std::pair<Label, std::size_t>>> moves(enfa.state_count);
  for (const auto& t : enfa.transitions) {
    if (t.is_epsilon()) {
      eps[t.from].push_back(t.to);
    } else {
      moves[t.from].emplace_back(*t.label, t.to);
    }
  }
  auto closure = [&](const Subset& seeds) {
    Subset out = seeds;
    std::vector<std::size_t> stack(seeds.begin(), seeds.end());
    while (!stack.empty()) {
      const std::size_t s = stack.back();
      stack.pop_back();
      for (std::size_t n : eps[s]) {
        if (out.insert(n).second) stack.push_back(n);
      }
    }
    return out;
  };
  auto is_accepting = [&](const Subset& s) {
    return std::any_of(s.begin(), s.end(), [&](std::size_t x) { return enfa.accepting.count(x) != 0; });
  };

  Dfa dfa;
  std::map<Subset, std::size_t> ids;
  std::deque<Subset> queue;

  const Subset start = closure({enfa.start});
  ids.emplace(start, 0);
  dfa.states.emplace_back();
  if (is_accepting(start)) dfa.accepting.insert(0);
  queue.push_back(start);

  while (!queue.empty()) {
    const Subset current = std::move(queue.front());
    queue.pop_front();
    const std::size_t current_id = ids.at(current);

    std::map<Label, Subset> by_label;
    for (std::size_t s : current) {
      for (const auto& [label, to] : moves[s]) by_label[label].insert(to);
    }

    std::vector<DfaTransition> out;
    for (const auto& [label, seeds] : by_label) {
      const Subset dest = closure(seeds);
      auto it = ids.find(dest);
      std::size_t dest_id = 0;
      if (it != ids.end()) {
        dest_id = it->second;
      } else {
        dest_id = dfa.states.size();
        ids.emplace(dest, dest_id);
        dfa.states.emplace_back();
        if (is_accepting(dest)) dfa.accepting.insert(dest_id);
        queue.push_back(dest);
      }
      out.push_back(DfaTransition{label, dest_id});
    }
    dfa.states[current_id].transitions = std::move(out);
  }
  return dfa;
}

Dfa compile(const Expr& expr) {
  uint64_t duration_ns = 0;
  Dfa dfa;
  {
    ScopeTimer timer(duration_ns);
    dfa = determinize(to_enfa(expr));
  }
  ToolkitEvent ev;
  ev.component = "kat";
  ev.action = "compile";
  ev.subject = dfa_fingerprint(dfa);
  ev.duration_ns = duration_ns;
  ev.detail = std::to_string(dfa.states.size()) + " states";
  emit_toolkit_event(ev);
  return dfa;
}

std::optional<std::size_t> Dfa::step(std::size_t state, const Label& label) const {
  if (state >= states.size()) return std::nullopt;
  const auto& ts = states[state].transitions;
  auto it = std::lower_bound(ts.begin(), ts.end(), label,
                             [](const DfaTransition& t, const Label& l) { return t.label < l; });
  if (it == ts.end() || !(it->label == label)) return std::nullopt;
  return it->to;
}

bool Dfa::accepts(const std::vector<Label>& word) const {
  std::size_t state = start;
  for (const auto& symbol : word) {
    auto next = step(state, symbol);
    if (!next) return false;
    state = *next;
  }
  return is_accepting(state);
}

std::size_t Dfa::max_out_degree() const {
  std::size_t m = 0;
  for (const auto& s : states) m = std::max(m, s.transitions.size());
  return m;
}

std::optional<std::string> serialize_dfa(const Dfa& dfa, const SymbolEncoder& symbol_of, Error* error) {
  std::string out;
  append_le_u32(out, static_cast<std::uint32_t>(dfa.states.size()));
  append_le_u32(out, static_cast<std::uint32_t>(dfa.start));
  for (std::size_t i = 0; i < dfa.states.size(); ++i) {
    const auto& state = dfa.states[i];
    out += static_cast<char>(dfa.is_accepting(i) ? 1 : 0);
    append_le_u32(out, static_cast<std::uint32_t>(state.transitions.size()));
    for (const auto& t : state.transitions) {
      append_le_u32(out, static_cast<std::uint32_t>(t.to));
      auto bytes = symbol_of(t.label);
      if (!bytes) {
        set_error(error, ErrorCode::kat_parse_error, "no symbol encoding for " + to_string(t.label));
        return std::nullopt;
      }
      out += *bytes;
    }
  }
  return out;
}

std::string dfa_fingerprint(const Dfa& dfa) {
  std::ostringstream o;
  o << "start " << dfa.start << "\n";
  for (std::size_t i = 0; i < dfa.states.size(); ++i) {
    o << "state " << i << (dfa.is_accepting(i) ? " accept" : "") << "\n";
    for (const auto& t : dfa.states[i].transitions) o << "  " << to_string(t.label) << " -> " << t.to << "\n";
  }
  return hash_domain("nexus.dfa:", o.str());
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

std::optional<ParserConfig> ParserConfig::make(const std::vector<std::string>& actions,
                                               const std::vector<std::string>& tests, Error* error) {
  ParserConfig c;
  c.actions_.insert(actions.begin(), actions.end());
  c.tests_.insert(tests.begin(), tests.end());
  for (const auto& a : c.actions_) {
    if (c.tests_.count(a)) {
      set_error(error, ErrorCode::kat_parse_error, "symbol `" + a + "` cannot be both action and test");
      return std::nullopt;
    }
  }
  return c;
}

namespace {

enum class Tok { action, test, zero, one, plus, star, semicolon, lparen, rparen, bang, amp, pipe, end };

struct Token {
  Tok kind{Tok::end};
  std::string text;
  std::size_t pos{0};
};

bool ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool ident_continue(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

std::optional<std::vector<Token>> lex(const std::string& s, const ParserConfig& config, Error* error) {
  std::vector<Token> out;
  std::size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }
    Token t;
    t.pos = i;
    switch (c) {
      case '+': t.kind = Tok::plus; break;
      case '*': t.kind = Tok::star; break;
      case ';': t.kind = Tok::semicolon; break;
      case '(': t.kind = Tok::lparen; break;
      case ')': t.kind = Tok::rparen; break;
      case '!': t.kind = Tok::bang; break;
      case '&': t.kind = Tok::amp; break;
      case '|': t.kind = Tok::pipe; break;
      case '0': t.kind = Tok::zero; break;
      case '1': t.kind = Tok::one; break;
      default:
        if (!ident_start(c)) {
          set_error(error, ErrorCode::kat_parse_error,
                    std::string("unexpected character `") + c + "` at " + std::to_string(i));
          return std::nullopt;
        }
        {
          std::size_t e = i + 1;
          while (e < s.size() && ident_continue(s[e])) ++e;
          t.text = s.substr(i, e - i);
          if (config.is_action(t.text)) {
            t.kind = Tok::action;
          } else if (config.is_test(t.text)) {
            t.kind = Tok::test;
          } else {
            set_error(error, ErrorCode::kat_parse_error,
                      "unknown symbol `" + t.text + "` at " + std::to_string(i));
            return std::nullopt;
          }
          i = e;
          out.push_back(std::move(t));
          continue;
        }
    }
    ++i;
    out.push_back(std::move(t));
  }
  Token end;
  end.pos = s.size();
  out.push_back(end);
  return out;
}

struct Parser {
  const std::vector<Token>& toks;
  std::size_t i{0};
  std::optional<std::string> err;
  int depth{0};

  static constexpr int kMaxDepth = 256;

  Tok peek() const { return toks[i].kind; }
  bool eat(Tok k) {
    if (peek() != k) return false;
    ++i;
    return true;
  }
  void fail(const std::string& what) {
    if (!err) err = what + " at " + std::to_string(toks[i].pos);
  }

  bool begins_unary() const {
    switch (peek()) {
      case Tok::action:
      case Tok::test:
      case Tok::zero:
      case Tok::one:
      case Tok::lparen:
      case Tok::bang:
        return true;
      default:
        return false;
    }
  }

  ExprPtr parse_choice() {
    if (++depth > kMaxDepth) {
      fail("expression nested too deeply");
      return nullptr;
    }
    ExprPtr e = parse_concat();
    while (!err && eat(Tok::plus)) {
      ExprPtr r = parse_concat();
      if (err) break;
      e = choice(e, r);
    }
    --depth;
    return e;
  }

  ExprPtr parse_concat() {
    ExprPtr e = parse_unary();
    while (!err) {
      if (eat(Tok::semicolon) || begins_unary()) {
        ExprPtr r = parse_unary();
        if (err) break;
        e = seq(e, r);
        continue;
      }
      break;
    }
    return e;
  }

  ExprPtr parse_unary() {
    ExprPtr e = parse_primary();
    while (!err && eat(Tok::star)) e = star(e);
    return e;
  }

  ExprPtr parse_primary() {
    switch (peek()) {
      case Tok::action:
        return action(toks[i++].text);
      case Tok::test:
        return test(parse_test_disjunction(true));
      case Tok::bang:
        return test(parse_test_disjunction(false));
      case Tok::zero:
        ++i;
        return zero();
      case Tok::one:
        ++i;
        return one();
      case Tok::lparen: {
        ++i;
        ExprPtr e = parse_choice();
        if (!err && !eat(Tok::rparen)) fail("expected `)`");
        return e;
      }
      default:
        fail("unexpected token in expression");
        return nullptr;
    }
  }

  // `stop_on_choice` leaves '+' to the enclosing KAT choice.
  TestExpr parse_test_disjunction(bool stop_on_choice) {
    TestExpr e = parse_test_conjunction(stop_on_choice);
    while (!err && (peek() == Tok::pipe || (!stop_on_choice && peek() == Tok::plus))) {
      ++i;
      TestExpr r = parse_test_conjunction(stop_on_choice);
      e = tor(std::move(e), std::move(r));
    }
    return e;
  }

  TestExpr parse_test_conjunction(bool stop_on_choice) {
    TestExpr e = parse_test_negation(stop_on_choice);
    while (!err && eat(Tok::amp)) {
      TestExpr r = parse_test_negation(stop_on_choice);
      e = tand(std::move(e), std::move(r));
    }
    return e;
  }

  TestExpr parse_test_negation(bool stop_on_choice) {
    if (eat(Tok::bang)) {
      if (++depth > kMaxDepth) {
        fail("test nested too deeply");
        return tfalse();
      }
      TestExpr inner = parse_test_negation(false);
      --depth;
      return tnot(std::move(inner));
    }
    return parse_test_atom();
  }

  TestExpr parse_test_atom() {
    switch (peek()) {
      case Tok::test:
        return atom(toks[i++].text);
      case Tok::zero:
        ++i;
        return tfalse();
      case Tok::one:
        ++i;
        return ttrue();
      case Tok::lparen: {
        ++i;
        if (++depth > kMaxDepth) {
          fail("test nested too deeply");
          return tfalse();
        }
        TestExpr e = parse_test_disjunction(false);
        --depth;
        if (!err && !eat(Tok::rparen)) fail("expected `)`");
        return e;
      }
      default:
        fail("unexpected token in test expression");
        return tfalse();
    }
  }
};

}  // namespace

std::optional<ExprPtr> parse_kat(const std::string& text, const ParserConfig& config, Error* error) {
  auto toks = lex(text, config, error);
  if (!toks) return std::nullopt;
  Parser p{*toks};
  ExprPtr e = p.parse_choice();
  if (!p.err && p.peek() != Tok::end) p.fail("unexpected token after end of expression");
  if (p.err) {
    set_error(error, ErrorCode::kat_parse_error, *p.err);
    return std::nullopt;
  }
  return e;
}

}  // namespace nexus::kat
