#include "sqlrpc/compiler/template.hpp"

#include "sqlrpc/util/util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>

namespace sqlrpc::tmpl {

namespace {

constexpr int kMaxCallDepth = 64;

// --------------------------------------------------------------------------
// Tag lexer

struct Token {
  enum class Kind : std::uint8_t { Text, Expr, Stmt };
  Kind kind;
  std::string text;
  std::size_t begin;
  std::size_t end;
};

auto is_space(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto find_open(std::string_view src, std::size_t from) -> std::size_t {
  for (auto pos = src.find('{', from); pos != std::string_view::npos;
       pos = src.find('{', pos + 1)) {
    if (pos + 1 < src.size()) {
      char next = src[pos + 1];
      if (next == '{' || next == '%' || next == '#') {
        return pos;
      }
    }
  }
  return std::string_view::npos;
}

// Finds `closer` starting at `from`, skipping over quoted strings when the
// tag holds code.
auto find_close(std::string_view src, std::size_t from, std::string_view closer,
                bool code) -> std::size_t {
  char quote = 0;
  for (auto i = from; i < src.size(); ++i) {
    char c = src[i];
    if (quote != 0) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (code && (c == '\'' || c == '"')) {
      quote = c;
      continue;
    }
    if (src.substr(i, closer.size()) == closer) {
      return i;
    }
  }
  return std::string_view::npos;
}

auto rstrip_whitespace(std::string& s) -> void {
  while (!s.empty() && is_space(s.back())) {
    s.pop_back();
  }
}

auto lstrip_whitespace(std::string_view s) -> std::string_view {
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  return s;
}

struct EndRaw {
  std::size_t begin;
  std::size_t end;
  bool strip_left;
  bool strip_right;
};

auto find_endraw(std::string_view src, std::size_t from)
    -> std::optional<EndRaw> {
  for (auto pos = src.find("{%", from); pos != std::string_view::npos;
       pos = src.find("{%", pos + 2)) {
    auto i = pos + 2;
    bool strip_left = false;
    if (i < src.size() && src[i] == '-') {
      strip_left = true;
      ++i;
    }
    while (i < src.size() && is_space(src[i])) {
      ++i;
    }
    if (src.substr(i, 6) != "endraw") {
      continue;
    }
    i += 6;
    while (i < src.size() && is_space(src[i])) {
      ++i;
    }
    bool strip_right = false;
    if (i < src.size() && src[i] == '-') {
      strip_right = true;
      ++i;
    }
    if (src.substr(i, 2) != "%}") {
      continue;
    }
    return EndRaw{pos, i + 2, strip_left, strip_right};
  }
  return std::nullopt;
}

class Lexer {
public:
  explicit Lexer(std::string_view src) : src_(src) {
  }

  auto run() -> TResult<std::vector<Token>> {
    std::size_t pos = 0;
    while (pos < src_.size()) {
      auto open = find_open(src_, pos);
      if (open == std::string_view::npos) {
        push_text(src_.substr(pos), pos, src_.size());
        break;
      }
      push_text(src_.substr(pos, open - pos), pos, open);

      char kind = src_[open + 1];
      auto inner = open + 2;
      bool strip_left = false;
      if (inner < src_.size() && (src_[inner] == '-' || src_[inner] == '+')) {
        strip_left = src_[inner] == '-';
        ++inner;
      }

      std::string_view closer = kind == '{' ? "}}" : kind == '%' ? "%}" : "#}";
      auto close = find_close(src_, inner, closer, kind != '#');
      if (close == std::string_view::npos) {
        if (kind == '#') {
          return template_error("Missing end of comment tag");
        }
        return template_error(std::format(
            "unexpected end of template, expected '{}'", closer));
      }

      bool strip_right = close > inner && src_[close - 1] == '-';
      auto content =
          src_.substr(inner, close - inner - (strip_right ? 1 : 0));
      auto end = close + 2;

      if (strip_left && !tokens_.empty() &&
          tokens_.back().kind == Token::Kind::Text) {
        rstrip_whitespace(tokens_.back().text);
        if (tokens_.back().text.empty()) {
          tokens_.pop_back();
        }
      }

      if (kind == '#') {
        strip_next_ = strip_right;
        pos = end;
        continue;
      }

      auto trimmed = std::string(trim(content));
      if (kind == '%' && trimmed == "raw") {
        auto endraw = find_endraw(src_, end);
        if (!endraw) {
          return template_error("Missing end of raw directive");
        }
        std::string body{src_.substr(end, endraw->begin - end)};
        if (strip_right) {
          body = std::string(lstrip_whitespace(body));
        }
        if (endraw->strip_left) {
          rstrip_whitespace(body);
        }
        strip_next_ = false;
        if (!body.empty()) {
          tokens_.push_back(
              {Token::Kind::Text, std::move(body), open, endraw->end});
        }
        strip_next_ = endraw->strip_right;
        pos = endraw->end;
        continue;
      }

      tokens_.push_back({kind == '{' ? Token::Kind::Expr : Token::Kind::Stmt,
                         std::move(trimmed), open, end});
      strip_next_ = strip_right;
      pos = end;
    }
    return std::move(tokens_);
  }

private:
  auto push_text(std::string_view text, std::size_t begin, std::size_t end)
      -> void {
    if (strip_next_) {
      text = lstrip_whitespace(text);
      strip_next_ = false;
    }
    if (!text.empty()) {
      tokens_.push_back({Token::Kind::Text, std::string(text), begin, end});
    }
  }

  std::string_view src_;
  std::vector<Token> tokens_;
  bool strip_next_ = false;
};

// --------------------------------------------------------------------------
// Expression lexer

struct ETok {
  enum class Kind : std::uint8_t { Name, String, Number, Op, End };
  Kind kind;
  std::string text;
  Value number;
};

auto lex_expression(std::string_view src) -> TResult<std::vector<ETok>> {
  std::vector<ETok> out;
  std::size_t i = 0;
  while (i < src.size()) {
    char c = src[i];
    if (is_space(c)) {
      ++i;
      continue;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      auto start = i;
      while (i < src.size() && (std::isalnum(static_cast<unsigned char>(
                                    src[i])) ||
                                src[i] == '_')) {
        ++i;
      }
      out.push_back({ETok::Kind::Name, std::string(src.substr(start, i - start)),
                     {}});
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      auto start = i;
      bool is_float = false;
      while (i < src.size() &&
             (std::isdigit(static_cast<unsigned char>(src[i])) ||
              (src[i] == '.' && !is_float && i + 1 < src.size() &&
               std::isdigit(static_cast<unsigned char>(src[i + 1]))))) {
        if (src[i] == '.') {
          is_float = true;
        }
        ++i;
      }
      auto text = src.substr(start, i - start);
      Value number;
      if (is_float) {
        double d = 0;
        std::from_chars(text.data(), text.data() + text.size(), d);
        number = d;
      } else {
        std::int64_t n = 0;
        std::from_chars(text.data(), text.data() + text.size(), n);
        number = n;
      }
      out.push_back({ETok::Kind::Number, std::string(text), std::move(number)});
      continue;
    }
    if (c == '\'' || c == '"') {
      std::string value;
      ++i;
      bool closed = false;
      while (i < src.size()) {
        char d = src[i++];
        if (d == '\\' && i < src.size()) {
          char e = src[i++];
          switch (e) {
            case 'n':
              value.push_back('\n');
              break;
            case 't':
              value.push_back('\t');
              break;
            default:
              value.push_back(e);
              break;
          }
          continue;
        }
        if (d == c) {
          closed = true;
          break;
        }
        value.push_back(d);
      }
      if (!closed) {
        return template_error("unexpected end of string literal");
      }
      out.push_back({ETok::Kind::String, std::move(value), {}});
      continue;
    }

    static constexpr std::string_view two_char[] = {"==", "!=", "<=", ">="};
    bool matched = false;
    for (auto op : two_char) {
      if (src.substr(i, 2) == op) {
        out.push_back({ETok::Kind::Op, std::string(op), {}});
        i += 2;
        matched = true;
        break;
      }
    }
    if (matched) {
      continue;
    }
    if (std::string_view{"()[]{},.=+-*/~<>:|%"}.find(c) !=
        std::string_view::npos) {
      out.push_back({ETok::Kind::Op, std::string(1, c), {}});
      ++i;
      continue;
    }
    return template_error(std::format("unexpected char '{}' at {}", c, i));
  }
  out.push_back({ETok::Kind::End, "", {}});
  return out;
}

}  // namespace

// --------------------------------------------------------------------------
// AST

struct Expr {
  enum class Kind : std::uint8_t {
    Literal,
    Name,
    Call,
    Attr,
    Index,
    Not,
    Negate,
    Binary,
    List,
    Dict,
  };
  Kind kind;
  Value literal;
  std::string name;
  std::vector<std::unique_ptr<Expr>> args;
  std::vector<std::pair<std::string, std::unique_ptr<Expr>>> kwargs;
};

using ExprPtr = std::unique_ptr<Expr>;

struct Stmt;
using Body = std::vector<std::unique_ptr<Stmt>>;

struct Stmt {
  enum class Kind : std::uint8_t { Text, Output, If, For, Set, MacroDef };
  Kind kind;
  std::string text;
  ExprPtr expr;
  std::vector<std::pair<ExprPtr, Body>> branches;
  Body else_body;
  Body body;
  std::vector<std::string> params;
  std::vector<ExprPtr> defaults;
};

struct Program {
  std::string source;
  std::string stripped_source;
  Body body;
  std::vector<const Stmt*> macro_defs;
};

class Macro {
public:
  Macro(std::shared_ptr<const Program> program, const Stmt* def)
      : program_(std::move(program)), def_(def) {
  }

  [[nodiscard]] auto name() const -> const std::string& {
    return def_->text;
  }
  [[nodiscard]] auto def() const -> const Stmt& {
    return *def_;
  }

private:
  std::shared_ptr<const Program> program_;
  const Stmt* def_;
};

auto macro_name(const Macro& macro) -> const std::string& {
  return macro.name();
}

namespace {

// --------------------------------------------------------------------------
// Expression parser

auto make_expr(Expr::Kind kind) -> ExprPtr {
  auto e = std::make_unique<Expr>();
  e->kind = kind;
  return e;
}

class ExprParser {
public:
  explicit ExprParser(std::vector<ETok> toks) : toks_(std::move(toks)) {
  }

  auto parse_expression() -> TResult<ExprPtr> {
    return parse_or();
  }

  [[nodiscard]] auto at_end() const -> bool {
    return peek().kind == ETok::Kind::End;
  }

  [[nodiscard]] auto peek() const -> const ETok& {
    return toks_[pos_];
  }

  auto next() -> const ETok& {
    const auto& t = toks_[pos_];
    if (t.kind != ETok::Kind::End) {
      ++pos_;
    }
    return t;
  }

  auto accept_op(std::string_view op) -> bool {
    if (peek().kind == ETok::Kind::Op && peek().text == op) {
      ++pos_;
      return true;
    }
    return false;
  }

  auto accept_name(std::string_view name) -> bool {
    if (peek().kind == ETok::Kind::Name && peek().text == name) {
      ++pos_;
      return true;
    }
    return false;
  }

  auto expect_op(std::string_view op) -> TResult<void> {
    if (!accept_op(op)) {
      return unexpected(std::format("expected '{}'", op));
    }
    return {};
  }

  auto expect_name() -> TResult<std::string> {
    if (peek().kind != ETok::Kind::Name) {
      return unexpected("expected name");
    }
    return next().text;
  }

  auto unexpected(std::string_view what) const -> std::unexpected<TemplateError> {
    const auto& t = peek();
    if (t.kind == ETok::Kind::End) {
      return template_error(std::format("{}, got end of statement", what));
    }
    return template_error(std::format("{}, got '{}'", what, t.text));
  }

private:
  auto binary(std::string op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    auto e = make_expr(Expr::Kind::Binary);
    e->name = std::move(op);
    e->args.push_back(std::move(lhs));
    e->args.push_back(std::move(rhs));
    return e;
  }

  auto parse_or() -> TResult<ExprPtr> {
    auto lhs = parse_and();
    if (!lhs) {
      return lhs;
    }
    while (accept_name("or")) {
      auto rhs = parse_and();
      if (!rhs) {
        return rhs;
      }
      *lhs = binary("or", std::move(*lhs), std::move(*rhs));
    }
    return lhs;
  }

  auto parse_and() -> TResult<ExprPtr> {
    auto lhs = parse_not();
    if (!lhs) {
      return lhs;
    }
    while (accept_name("and")) {
      auto rhs = parse_not();
      if (!rhs) {
        return rhs;
      }
      *lhs = binary("and", std::move(*lhs), std::move(*rhs));
    }
    return lhs;
  }

  auto parse_not() -> TResult<ExprPtr> {
    if (accept_name("not")) {
      auto operand = parse_not();
      if (!operand) {
        return operand;
      }
      auto e = make_expr(Expr::Kind::Not);
      e->args.push_back(std::move(*operand));
      return e;
    }
    return parse_compare();
  }

  auto parse_compare() -> TResult<ExprPtr> {
    auto lhs = parse_concat();
    if (!lhs) {
      return lhs;
    }
    static constexpr std::string_view ops[] = {"==", "!=", "<=", ">=", "<",
                                               ">"};
    for (;;) {
      std::string op;
      for (auto candidate : ops) {
        if (accept_op(candidate)) {
          op = candidate;
          break;
        }
      }
      if (op.empty()) {
        if (accept_name("in")) {
          op = "in";
        } else if (peek().kind == ETok::Kind::Name && peek().text == "not" &&
                   pos_ + 1 < toks_.size() &&
                   toks_[pos_ + 1].kind == ETok::Kind::Name &&
                   toks_[pos_ + 1].text == "in") {
          pos_ += 2;
          op = "not in";
        } else {
          return lhs;
        }
      }
      auto rhs = parse_concat();
      if (!rhs) {
        return rhs;
      }
      *lhs = binary(std::move(op), std::move(*lhs), std::move(*rhs));
    }
  }

  auto parse_concat() -> TResult<ExprPtr> {
    auto lhs = parse_additive();
    if (!lhs) {
      return lhs;
    }
    while (accept_op("~")) {
      auto rhs = parse_additive();
      if (!rhs) {
        return rhs;
      }
      *lhs = binary("~", std::move(*lhs), std::move(*rhs));
    }
    return lhs;
  }

  auto parse_additive() -> TResult<ExprPtr> {
    auto lhs = parse_multiplicative();
    if (!lhs) {
      return lhs;
    }
    for (;;) {
      std::string op;
      if (accept_op("+")) {
        op = "+";
      } else if (accept_op("-")) {
        op = "-";
      } else {
        return lhs;
      }
      auto rhs = parse_multiplicative();
      if (!rhs) {
        return rhs;
      }
      *lhs = binary(std::move(op), std::move(*lhs), std::move(*rhs));
    }
  }

  auto parse_multiplicative() -> TResult<ExprPtr> {
    auto lhs = parse_unary();
    if (!lhs) {
      return lhs;
    }
    for (;;) {
      std::string op;
      if (accept_op("*")) {
        op = "*";
      } else if (accept_op("/")) {
        op = "/";
      } else if (accept_op("%")) {
        op = "%";
      } else {
        return lhs;
      }
      auto rhs = parse_unary();
      if (!rhs) {
        return rhs;
      }
      *lhs = binary(std::move(op), std::move(*lhs), std::move(*rhs));
    }
  }

  auto parse_unary() -> TResult<ExprPtr> {
    if (accept_op("-")) {
      auto operand = parse_unary();
      if (!operand) {
        return operand;
      }
      auto e = make_expr(Expr::Kind::Negate);
      e->args.push_back(std::move(*operand));
      return e;
    }
    return parse_postfix();
  }

  auto parse_postfix() -> TResult<ExprPtr> {
    auto base = parse_primary();
    if (!base) {
      return base;
    }
    for (;;) {
      if (accept_op("(")) {
        auto call = make_expr(Expr::Kind::Call);
        if ((*base)->kind != Expr::Kind::Name) {
          return template_error("only named functions can be called");
        }
        call->name = std::move((*base)->name);
        if (auto r = parse_call_args(*call); !r) {
          return std::unexpected(r.error());
        }
        *base = std::move(call);
      } else if (accept_op(".")) {
        auto member = expect_name();
        if (!member) {
          return std::unexpected(member.error());
        }
        auto attr = make_expr(Expr::Kind::Attr);
        attr->name = std::move(*member);
        attr->args.push_back(std::move(*base));
        *base = std::move(attr);
      } else if (accept_op("[")) {
        auto key = parse_expression();
        if (!key) {
          return key;
        }
        if (auto r = expect_op("]"); !r) {
          return std::unexpected(r.error());
        }
        auto index = make_expr(Expr::Kind::Index);
        index->args.push_back(std::move(*base));
        index->args.push_back(std::move(*key));
        *base = std::move(index);
      } else {
        return base;
      }
    }
  }

  auto parse_call_args(Expr& call) -> TResult<void> {
    if (accept_op(")")) {
      return {};
    }
    for (;;) {
      if (peek().kind == ETok::Kind::Name && pos_ + 1 < toks_.size() &&
          toks_[pos_ + 1].kind == ETok::Kind::Op &&
          toks_[pos_ + 1].text == "=") {
        auto key = next().text;
        ++pos_;
        auto value = parse_expression();
        if (!value) {
          return std::unexpected(value.error());
        }
        call.kwargs.emplace_back(std::move(key), std::move(*value));
      } else {
        if (!call.kwargs.empty()) {
          return template_error(
              "positional argument follows keyword argument");
        }
        auto value = parse_expression();
        if (!value) {
          return std::unexpected(value.error());
        }
        call.args.push_back(std::move(*value));
      }
      if (accept_op(")")) {
        return {};
      }
      if (auto r = expect_op(","); !r) {
        return r;
      }
    }
  }

  auto parse_primary() -> TResult<ExprPtr> {
    const auto& t = peek();
    switch (t.kind) {
      case ETok::Kind::String: {
        auto e = make_expr(Expr::Kind::Literal);
        e->literal = next().text;
        // Adjacent string literals concatenate.
        while (peek().kind == ETok::Kind::String) {
          e->literal = e->literal.get<std::string>() + next().text;
        }
        return e;
      }
      case ETok::Kind::Number: {
        auto e = make_expr(Expr::Kind::Literal);
        e->literal = next().number;
        return e;
      }
      case ETok::Kind::Name: {
        auto name = next().text;
        auto e = make_expr(Expr::Kind::Literal);
        if (name == "True" || name == "true") {
          e->literal = true;
        } else if (name == "False" || name == "false") {
          e->literal = false;
        } else if (name == "None" || name == "none") {
          e->literal = nullptr;
        } else {
          e->kind = Expr::Kind::Name;
          e->name = std::move(name);
        }
        return e;
      }
      case ETok::Kind::Op:
        if (accept_op("(")) {
          auto inner = parse_expression();
          if (!inner) {
            return inner;
          }
          if (auto r = expect_op(")"); !r) {
            return std::unexpected(r.error());
          }
          return inner;
        }
        if (accept_op("[")) {
          auto list = make_expr(Expr::Kind::List);
          if (accept_op("]")) {
            return list;
          }
          for (;;) {
            auto item = parse_expression();
            if (!item) {
              return item;
            }
            list->args.push_back(std::move(*item));
            if (accept_op("]")) {
              return list;
            }
            if (auto r = expect_op(","); !r) {
              return std::unexpected(r.error());
            }
          }
        }
        if (accept_op("{")) {
          auto dict = make_expr(Expr::Kind::Dict);
          if (accept_op("}")) {
            return dict;
          }
          for (;;) {
            if (peek().kind != ETok::Kind::String) {
              return unexpected("expected string key");
            }
            auto key = next().text;
            if (auto r = expect_op(":"); !r) {
              return std::unexpected(r.error());
            }
            auto value = parse_expression();
            if (!value) {
              return value;
            }
            dict->kwargs.emplace_back(std::move(key), std::move(*value));
            if (accept_op("}")) {
              return dict;
            }
            if (auto r = expect_op(","); !r) {
              return std::unexpected(r.error());
            }
          }
        }
        break;
      case ETok::Kind::End:
        break;
    }
    return unexpected("unexpected token");
  }

  std::vector<ETok> toks_;
  std::size_t pos_ = 0;
};

auto parse_full_expression(std::string_view src) -> TResult<ExprPtr> {
  auto toks = lex_expression(src);
  if (!toks) {
    return std::unexpected(toks.error());
  }
  ExprParser parser(std::move(*toks));
  auto expr = parser.parse_expression();
  if (!expr) {
    return expr;
  }
  if (!parser.at_end()) {
    return parser.unexpected("expected end of expression");
  }
  return expr;
}

// --------------------------------------------------------------------------
// Statement parser

auto split_tag(std::string_view content)
    -> std::pair<std::string_view, std::string_view> {
  std::size_t i = 0;
  while (i < content.size() &&
         (std::isalnum(static_cast<unsigned char>(content[i])) ||
          content[i] == '_')) {
    ++i;
  }
  return {content.substr(0, i), trim(content.substr(i))};
}

class Parser {
public:
  Parser(const std::vector<Token>& tokens, Program& program)
      : tokens_(tokens), program_(program) {
  }

  struct Terminator {
    std::string tag;
    std::string_view rest;
    const Token* token = nullptr;
  };

  auto parse_body(std::initializer_list<std::string_view> until,
                  Terminator& term) -> TResult<Body> {
    Body body;
    while (pos_ < tokens_.size()) {
      const auto& tok = tokens_[pos_++];
      switch (tok.kind) {
        case Token::Kind::Text: {
          auto stmt = std::make_unique<Stmt>();
          stmt->kind = Stmt::Kind::Text;
          stmt->text = tok.text;
          body.push_back(std::move(stmt));
          break;
        }
        case Token::Kind::Expr: {
          auto expr = parse_full_expression(tok.text);
          if (!expr) {
            return std::unexpected(expr.error());
          }
          auto stmt = std::make_unique<Stmt>();
          stmt->kind = Stmt::Kind::Output;
          stmt->expr = std::move(*expr);
          body.push_back(std::move(stmt));
          break;
        }
        case Token::Kind::Stmt: {
          auto [tag, rest] = split_tag(tok.text);
          if (std::ranges::find(until, tag) != until.end()) {
            term = {std::string(tag), rest, &tok};
            return body;
          }
          auto stmt = parse_statement(tag, rest, tok);
          if (!stmt) {
            return std::unexpected(stmt.error());
          }
          body.push_back(std::move(*stmt));
          break;
        }
      }
    }
    term = {};
    if (until.size() > 0) {
      std::string expected;
      for (auto tag : until) {
        if (!expected.empty()) {
          expected += ", ";
        }
        expected += std::format("'{}'", tag);
      }
      return template_error(std::format(
          "Unexpected end of template. Jinja was looking for the following "
          "tags: {}",
          expected));
    }
    return body;
  }

private:
  auto parse_statement(std::string_view tag, std::string_view rest,
                       const Token& tok) -> TResult<std::unique_ptr<Stmt>> {
    if (tag == "if") {
      return parse_if(rest);
    }
    if (tag == "for") {
      return parse_for(rest);
    }
    if (tag == "set") {
      return parse_set(rest);
    }
    if (tag == "macro") {
      return parse_macro(rest, tok);
    }
    return template_error(std::format("Encountered unknown tag '{}'.", tag));
  }

  auto parse_if(std::string_view cond_src) -> TResult<std::unique_ptr<Stmt>> {
    auto stmt = std::make_unique<Stmt>();
    stmt->kind = Stmt::Kind::If;
    ++depth_;

    std::string current{cond_src};
    for (;;) {
      auto cond = parse_full_expression(current);
      if (!cond) {
        return std::unexpected(cond.error());
      }
      Terminator term;
      auto body = parse_body({"elif", "else", "endif"}, term);
      if (!body) {
        return std::unexpected(body.error());
      }
      stmt->branches.emplace_back(std::move(*cond), std::move(*body));
      if (term.tag == "elif") {
        current = std::string(term.rest);
        continue;
      }
      if (term.tag == "else") {
        auto else_body = parse_body({"endif"}, term);
        if (!else_body) {
          return std::unexpected(else_body.error());
        }
        stmt->else_body = std::move(*else_body);
      }
      break;
    }
    --depth_;
    return stmt;
  }

  auto parse_for(std::string_view src) -> TResult<std::unique_ptr<Stmt>> {
    auto toks = lex_expression(src);
    if (!toks) {
      return std::unexpected(toks.error());
    }
    ExprParser parser(std::move(*toks));
    auto var = parser.expect_name();
    if (!var) {
      return std::unexpected(var.error());
    }
    if (!parser.accept_name("in")) {
      return parser.unexpected("expected 'in'");
    }
    auto iterable = parser.parse_expression();
    if (!iterable) {
      return std::unexpected(iterable.error());
    }
    if (!parser.at_end()) {
      return parser.unexpected("expected end of statement");
    }

    auto stmt = std::make_unique<Stmt>();
    stmt->kind = Stmt::Kind::For;
    stmt->text = std::move(*var);
    stmt->expr = std::move(*iterable);

    ++depth_;
    Terminator term;
    auto body = parse_body({"endfor"}, term);
    --depth_;
    if (!body) {
      return std::unexpected(body.error());
    }
    stmt->body = std::move(*body);
    return stmt;
  }

  auto parse_set(std::string_view src) -> TResult<std::unique_ptr<Stmt>> {
    auto eq = src.find('=');
    if (eq == std::string_view::npos) {
      return template_error("expected '=' in set statement");
    }
    auto target = std::string(trim(src.substr(0, eq)));
    if (target.empty()) {
      return template_error("expected name in set statement");
    }
    auto value = parse_full_expression(src.substr(eq + 1));
    if (!value) {
      return std::unexpected(value.error());
    }
    auto stmt = std::make_unique<Stmt>();
    stmt->kind = Stmt::Kind::Set;
    stmt->text = std::move(target);
    stmt->expr = std::move(*value);
    return stmt;
  }

  auto parse_macro(std::string_view src, const Token& open)
      -> TResult<std::unique_ptr<Stmt>> {
    if (depth_ > 0) {
      return template_error("macro definitions must be at the top level");
    }
    auto toks = lex_expression(src);
    if (!toks) {
      return std::unexpected(toks.error());
    }
    ExprParser parser(std::move(*toks));

    auto stmt = std::make_unique<Stmt>();
    stmt->kind = Stmt::Kind::MacroDef;
    auto name = parser.expect_name();
    if (!name) {
      return std::unexpected(name.error());
    }
    stmt->text = std::move(*name);

    if (auto r = parser.expect_op("("); !r) {
      return std::unexpected(r.error());
    }
    if (!parser.accept_op(")")) {
      for (;;) {
        auto param = parser.expect_name();
        if (!param) {
          return std::unexpected(param.error());
        }
        stmt->params.push_back(std::move(*param));
        ExprPtr default_value;
        if (parser.accept_op("=")) {
          auto value = parser.parse_expression();
          if (!value) {
            return std::unexpected(value.error());
          }
          default_value = std::move(*value);
        }
        stmt->defaults.push_back(std::move(default_value));
        if (parser.accept_op(")")) {
          break;
        }
        if (auto r = parser.expect_op(","); !r) {
          return std::unexpected(r.error());
        }
      }
    }
    if (!parser.at_end()) {
      return parser.unexpected("expected end of statement");
    }

    ++depth_;
    Terminator term;
    auto body = parse_body({"endmacro"}, term);
    --depth_;
    if (!body) {
      return std::unexpected(body.error());
    }
    stmt->body = std::move(*body);
    spans_.emplace_back(open.begin, term.token->end);
    program_.macro_defs.push_back(stmt.get());
    return stmt;
  }

public:
  std::vector<std::pair<std::size_t, std::size_t>> spans_;

private:
  const std::vector<Token>& tokens_;
  Program& program_;
  std::size_t pos_ = 0;
  int depth_ = 0;
};

// --------------------------------------------------------------------------
// Evaluation

using Scope = std::unordered_map<std::string, Value>;

struct Frame {
  std::vector<Scope> scopes;
};

class Renderer {
public:
  explicit Renderer(const Environment& env) : env_(env) {
    frames_.push_back(Frame{{Scope{}}});
  }

  auto render_body(const Body& body, std::string& out) -> TResult<void> {
    for (const auto& stmt : body) {
      if (auto r = render_stmt(*stmt, out); !r) {
        return r;
      }
    }
    return {};
  }

private:
  auto render_stmt(const Stmt& stmt, std::string& out) -> TResult<void> {
    switch (stmt.kind) {
      case Stmt::Kind::Text:
        out += stmt.text;
        return {};
      case Stmt::Kind::Output: {
        auto value = eval(*stmt.expr);
        if (!value) {
          return std::unexpected(value.error());
        }
        out += to_output(*value);
        return {};
      }
      case Stmt::Kind::If:
        for (const auto& [cond, body] : stmt.branches) {
          auto value = eval(*cond);
          if (!value) {
            return std::unexpected(value.error());
          }
          if (is_truthy(*value)) {
            return render_body(body, out);
          }
        }
        return render_body(stmt.else_body, out);
      case Stmt::Kind::For:
        return render_for(stmt, out);
      case Stmt::Kind::Set: {
        auto value = eval(*stmt.expr);
        if (!value) {
          return std::unexpected(value.error());
        }
        frames_.back().scopes.back()[stmt.text] = std::move(*value);
        return {};
      }
      case Stmt::Kind::MacroDef:
        return {};
    }
    return {};
  }

  auto render_for(const Stmt& stmt, std::string& out) -> TResult<void> {
    auto iterable = eval(*stmt.expr);
    if (!iterable) {
      return std::unexpected(iterable.error());
    }
    std::vector<Value> items;
    if (iterable->is_array()) {
      items.assign(iterable->begin(), iterable->end());
    } else if (iterable->is_object()) {
      for (const auto& [key, _] : iterable->items()) {
        items.emplace_back(key);
      }
    } else if (!iterable->is_null()) {
      return template_error(std::format("'{}' object is not iterable",
                                        iterable->type_name()));
    }

    frames_.back().scopes.emplace_back();
    for (std::size_t i = 0; i < items.size(); ++i) {
      auto& scope = frames_.back().scopes.back();
      scope[stmt.text] = items[i];
      scope["loop"] = Value{{"index", i + 1},
                            {"index0", i},
                            {"first", i == 0},
                            {"last", i + 1 == items.size()},
                            {"length", items.size()}};
      if (auto r = render_body(stmt.body, out); !r) {
        frames_.back().scopes.pop_back();
        return r;
      }
    }
    frames_.back().scopes.pop_back();
    return {};
  }

  auto lookup(const std::string& name) const -> const Value* {
    const auto& scopes = frames_.back().scopes;
    for (auto it = scopes.rbegin(); it != scopes.rend(); ++it) {
      if (auto found = it->find(name); found != it->end()) {
        return &found->second;
      }
    }
    return env_.find_variable(name);
  }

  auto eval(const Expr& expr) -> TResult<Value> {
    switch (expr.kind) {
      case Expr::Kind::Literal:
        return expr.literal;
      case Expr::Kind::Name: {
        if (const auto* v = lookup(expr.name)) {
          return *v;
        }
        return template_error(std::format("'{}' is undefined", expr.name));
      }
      case Expr::Kind::Call:
        return eval_call(expr);
      case Expr::Kind::Attr: {
        auto object = eval(*expr.args[0]);
        if (!object) {
          return object;
        }
        if (object->is_object() && object->contains(expr.name)) {
          return (*object)[expr.name];
        }
        return template_error(std::format("'{}' has no attribute '{}'",
                                          object->type_name(), expr.name));
      }
      case Expr::Kind::Index: {
        auto object = eval(*expr.args[0]);
        if (!object) {
          return object;
        }
        auto key = eval(*expr.args[1]);
        if (!key) {
          return key;
        }
        if (object->is_object() && key->is_string() &&
            object->contains(key->get<std::string>())) {
          return (*object)[key->get<std::string>()];
        }
        if (object->is_array() && key->is_number_integer()) {
          auto idx = key->get<std::int64_t>();
          auto size = static_cast<std::int64_t>(object->size());
          if (idx < 0) {
            idx += size;
          }
          if (idx >= 0 && idx < size) {
            return (*object)[static_cast<std::size_t>(idx)];
          }
        }
        return template_error(
            std::format("'{}' has no item {}", object->type_name(),
                        key->dump()));
      }
      case Expr::Kind::Not: {
        auto operand = eval(*expr.args[0]);
        if (!operand) {
          return operand;
        }
        return Value(!is_truthy(*operand));
      }
      case Expr::Kind::Negate: {
        auto operand = eval(*expr.args[0]);
        if (!operand) {
          return operand;
        }
        if (operand->is_number_integer()) {
          return Value(-operand->get<std::int64_t>());
        }
        if (operand->is_number()) {
          return Value(-operand->get<double>());
        }
        return template_error("bad operand type for unary -");
      }
      case Expr::Kind::Binary:
        return eval_binary(expr);
      case Expr::Kind::List: {
        Value list = Value::array();
        for (const auto& item : expr.args) {
          auto v = eval(*item);
          if (!v) {
            return v;
          }
          list.push_back(std::move(*v));
        }
        return list;
      }
      case Expr::Kind::Dict: {
        Value dict = Value::object();
        for (const auto& [key, item] : expr.kwargs) {
          auto v = eval(*item);
          if (!v) {
            return v;
          }
          dict[key] = std::move(*v);
        }
        return dict;
      }
    }
    return template_error("invalid expression");
  }

  auto eval_binary(const Expr& expr) -> TResult<Value> {
    const auto& op = expr.name;
    auto lhs = eval(*expr.args[0]);
    if (!lhs) {
      return lhs;
    }
    if (op == "and") {
      if (!is_truthy(*lhs)) {
        return lhs;
      }
      return eval(*expr.args[1]);
    }
    if (op == "or") {
      if (is_truthy(*lhs)) {
        return lhs;
      }
      return eval(*expr.args[1]);
    }

    auto rhs = eval(*expr.args[1]);
    if (!rhs) {
      return rhs;
    }
    const auto& a = *lhs;
    const auto& b = *rhs;

    if (op == "==") {
      return Value(a == b);
    }
    if (op == "!=") {
      return Value(a != b);
    }
    if (op == "<") {
      return Value(a < b);
    }
    if (op == ">") {
      return Value(b < a);
    }
    if (op == "<=") {
      return Value(!(b < a));
    }
    if (op == ">=") {
      return Value(!(a < b));
    }
    if (op == "in" || op == "not in") {
      bool found = false;
      if (b.is_array()) {
        found = std::find(b.begin(), b.end(), a) != b.end();
      } else if (b.is_object() && a.is_string()) {
        found = b.contains(a.get<std::string>());
      } else if (b.is_string() && a.is_string()) {
        found = b.get<std::string>().find(a.get<std::string>()) !=
                std::string::npos;
      } else {
        return template_error(std::format(
            "argument of type '{}' is not iterable", b.type_name()));
      }
      return Value(op == "in" ? found : !found);
    }
    if (op == "~") {
      return Value(to_output(a) + to_output(b));
    }
    if (op == "+") {
      if (a.is_string() && b.is_string()) {
        return Value(a.get<std::string>() + b.get<std::string>());
      }
      if (a.is_array() && b.is_array()) {
        Value joined = a;
        for (const auto& item : b) {
          joined.push_back(item);
        }
        return joined;
      }
    }
    if (a.is_number() && b.is_number()) {
      bool integral = a.is_number_integer() && b.is_number_integer();
      if (op == "+") {
        return integral ? Value(a.get<std::int64_t>() + b.get<std::int64_t>())
                        : Value(a.get<double>() + b.get<double>());
      }
      if (op == "-") {
        return integral ? Value(a.get<std::int64_t>() - b.get<std::int64_t>())
                        : Value(a.get<double>() - b.get<double>());
      }
      if (op == "*") {
        return integral ? Value(a.get<std::int64_t>() * b.get<std::int64_t>())
                        : Value(a.get<double>() * b.get<double>());
      }
      if (op == "/") {
        if (b.get<double>() == 0.0) {
          return template_error("division by zero");
        }
        return Value(a.get<double>() / b.get<double>());
      }
      if (op == "%" && integral) {
        if (b.get<std::int64_t>() == 0) {
          return template_error("integer division or modulo by zero");
        }
        return Value(a.get<std::int64_t>() % b.get<std::int64_t>());
      }
    }
    return template_error(std::format(
        "unsupported operand type(s) for {}: '{}' and '{}'", op, a.type_name(),
        b.type_name()));
  }

  auto eval_args(const Expr& expr) -> TResult<CallArgs> {
    CallArgs args;
    for (const auto& arg : expr.args) {
      auto v = eval(*arg);
      if (!v) {
        return std::unexpected(v.error());
      }
      args.positional.push_back(std::move(*v));
    }
    for (const auto& [key, arg] : expr.kwargs) {
      auto v = eval(*arg);
      if (!v) {
        return std::unexpected(v.error());
      }
      args.keyword.emplace_back(key, std::move(*v));
    }
    return args;
  }

  auto eval_call(const Expr& expr) -> TResult<Value> {
    const auto* macro = env_.find_macro(expr.name);
    const auto* fn = macro ? nullptr : env_.find_function(expr.name);
    if (macro == nullptr && fn == nullptr) {
      return template_error(std::format("'{}' is undefined", expr.name));
    }

    auto args = eval_args(expr);
    if (!args) {
      return std::unexpected(args.error());
    }
    if (fn != nullptr) {
      return (*fn)(*args);
    }
    return call_macro(*macro, *args);
  }

  auto call_macro(const Macro& macro, const CallArgs& args) -> TResult<Value> {
    const auto& def = macro.def();
    if (depth_ >= kMaxCallDepth) {
      return template_error("maximum recursion depth exceeded");
    }
    if (args.positional.size() > def.params.size()) {
      return template_error(
          std::format("macro '{}' takes not more than {} argument(s)",
                      def.text, def.params.size()));
    }

    frames_.push_back(Frame{{Scope{}}});
    ++depth_;
    auto result = [&]() -> TResult<Value> {
      for (std::size_t i = 0; i < def.params.size(); ++i) {
        const auto& param = def.params[i];
        if (i < args.positional.size()) {
          frames_.back().scopes.back()[param] = args.positional[i];
        } else if (const auto* kw = args.kwarg(param)) {
          frames_.back().scopes.back()[param] = *kw;
        } else if (def.defaults[i]) {
          auto v = eval(*def.defaults[i]);
          if (!v) {
            return v;
          }
          frames_.back().scopes.back()[param] = std::move(*v);
        }
      }
      for (const auto& [key, _] : args.keyword) {
        if (std::ranges::find(def.params, key) == def.params.end()) {
          return template_error(std::format(
              "macro '{}' takes no keyword argument '{}'", def.text, key));
        }
      }
      std::string out;
      if (auto r = render_body(def.body, out); !r) {
        return std::unexpected(r.error());
      }
      return Value(std::move(out));
    }();
    --depth_;
    frames_.pop_back();
    return result;
  }

  const Environment& env_;
  std::vector<Frame> frames_;
  int depth_ = 0;
};

}  // namespace

auto CallArgs::kwarg(std::string_view name) const -> const Value* {
  for (const auto& [key, value] : keyword) {
    if (key == name) {
      return &value;
    }
  }
  return nullptr;
}

auto CallArgs::arg(std::size_t index, std::string_view name) const
    -> const Value* {
  if (index < positional.size()) {
    return &positional[index];
  }
  return kwarg(name);
}

auto Environment::define(std::shared_ptr<const Macro> macro) -> void {
  auto name = macro->name();
  macros_[std::move(name)] = std::move(macro);
}

auto Environment::define_all(const Template& tmpl) -> void {
  for (const auto& macro : tmpl.macros()) {
    define(macro);
  }
}

auto Environment::set_function(std::string name, Function fn) -> void {
  functions_[std::move(name)] = std::move(fn);
}

auto Environment::set_variable(std::string name, Value value) -> void {
  variables_[std::move(name)] = std::move(value);
}

auto Environment::find_macro(std::string_view name) const -> const Macro* {
  auto it = macros_.find(std::string(name));
  return it != macros_.end() ? it->second.get() : nullptr;
}

auto Environment::find_function(std::string_view name) const
    -> const Function* {
  auto it = functions_.find(std::string(name));
  return it != functions_.end() ? &it->second : nullptr;
}

auto Environment::find_variable(std::string_view name) const -> const Value* {
  auto it = variables_.find(std::string(name));
  return it != variables_.end() ? &it->second : nullptr;
}

auto Template::parse(std::string_view source) -> TResult<Template> {
  auto tokens = Lexer(source).run();
  if (!tokens) {
    return std::unexpected(tokens.error());
  }

  auto program = std::make_shared<Program>();
  program->source = std::string(source);

  Parser parser(*tokens, *program);
  Parser::Terminator term;
  auto body = parser.parse_body({}, term);
  if (!body) {
    return std::unexpected(body.error());
  }
  program->body = std::move(*body);

  std::size_t cursor = 0;
  for (auto [begin, end] : parser.spans_) {
    program->stripped_source.append(source.substr(cursor, begin - cursor));
    cursor = end;
  }
  program->stripped_source.append(source.substr(cursor));

  Template tmpl;
  tmpl.program_ = program;
  for (const auto* def : program->macro_defs) {
    tmpl.macros_.push_back(std::make_shared<const Macro>(program, def));
  }
  return tmpl;
}

auto Template::render(const Environment& env) const -> TResult<std::string> {
  std::string out;
  Renderer renderer(env);
  if (auto r = renderer.render_body(program_->body, out); !r) {
    return std::unexpected(r.error());
  }
  return out;
}

auto Template::source_without_macros() const -> const std::string& {
  return program_->stripped_source;
}

auto to_output(const Value& value) -> std::string {
  switch (value.type()) {
    case Value::value_t::string:
      return value.get<std::string>();
    case Value::value_t::boolean:
      return value.get<bool>() ? "True" : "False";
    case Value::value_t::null:
      return "None";
    default:
      return value.dump();
  }
}

auto is_truthy(const Value& value) noexcept -> bool {
  switch (value.type()) {
    case Value::value_t::null:
    case Value::value_t::discarded:
      return false;
    case Value::value_t::boolean:
      return value.get<bool>();
    case Value::value_t::number_integer:
      return value.get<std::int64_t>() != 0;
    case Value::value_t::number_unsigned:
      return value.get<std::uint64_t>() != 0;
    case Value::value_t::number_float:
      return value.get<double>() != 0.0;
    case Value::value_t::string:
      return !value.get_ref<const std::string&>().empty();
    case Value::value_t::array:
    case Value::value_t::object:
    case Value::value_t::binary:
      return !value.empty();
  }
  return false;
}

}  // namespace sqlrpc::tmpl
