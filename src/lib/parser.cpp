#include <chattpl/parser.hpp>

#include <chattpl/error.hpp>

#include <utility>

namespace chattpl {

  namespace {

    bool
    is_terminator_keyword(token_kind k) {
      return k == token_kind::kw_elif || k == token_kind::kw_else ||
             k == token_kind::kw_endfor || k == token_kind::kw_endif;
    }

    ast::expression
    make_binary(ast::expression lhs, ast::binary_operator op,
                ast::expression rhs) {
      return ast::binary_op{ast::make_expression(std::move(lhs)), op,
                            ast::make_expression(std::move(rhs))};
    }

  } // namespace

  parser::parser(tokenizer lex) : lex_(lex) {}

  // -------------------------------------------------------------------------
  // Token buffer
  // -------------------------------------------------------------------------

  const token*
  parser::peek(std::size_t n) {
    while (lookahead_.size() <= n && !exhausted_) {
      auto tok = lex_.next();
      if (!tok) {
        exhausted_ = true;
        break;
      }
      lookahead_.push_back(std::move(*tok));
    }
    return n < lookahead_.size() ? &lookahead_[n] : nullptr;
  }

  bool
  parser::peek_is(std::size_t n, token_kind k) {
    auto tok = peek(n);
    return tok != nullptr && tok->kind == k;
  }

  token
  parser::consume() {
    if (peek(0) == nullptr) error("unexpected end of input");
    auto tok = std::move(lookahead_.front());
    lookahead_.pop_front();
    return tok;
  }

  token
  parser::expect(token_kind k) {
    auto tok = peek(0);
    if (tok == nullptr || tok->kind != k) unexpected(to_string(k));
    return consume();
  }

  [[noreturn]] void
  parser::error(const std::string& msg) {
    auto offset =
        lookahead_.empty() ? lex_.input().size() : lookahead_.front().offset;
    throw parse_error(msg, line_at(lex_.input(), offset));
  }

  [[noreturn]] void
  parser::unexpected(const std::string& what) {
    auto tok = peek(0);
    auto got = tok == nullptr ? std::string("end of input") : describe(*tok);
    error("expected " + what + ", got " + got);
  }

  // -------------------------------------------------------------------------
  // Statements
  // -------------------------------------------------------------------------

  ast::template_body
  parser::parse() {
    auto body = parse_sequence();

    // A terminator tag with no construct open to close.
    if (peek(0) != nullptr) {
      auto keyword = peek(1);
      error("unexpected " +
            (keyword ? to_string(keyword->kind) : std::string("'{%'")) +
            " outside of any block");
    }
    return body;
  }

  // {% elif %}, {% else %}, {% endfor %} and {% endif %} close the enclosing
  // construct and are left for its parser.
  bool
  parser::at_terminator() {
    if (!peek_is(0, token_kind::block_start)) return false;
    auto keyword = peek(1);
    return keyword != nullptr && is_terminator_keyword(keyword->kind);
  }

  ast::template_body
  parser::parse_sequence() {
    ast::template_body nodes;
    while (!at_terminator()) {
      auto tok = peek(0);
      if (tok == nullptr) break;

      switch (tok->kind) {
        case token_kind::text:
          nodes.emplace_back(ast::text_node{consume().value});
          break;
        case token_kind::var_start: {
          consume();
          auto expr = parse_expr();
          expect(token_kind::var_end);
          nodes.emplace_back(ast::output_node{std::move(expr)});
          break;
        }
        case token_kind::block_start:
          consume();
          nodes.push_back(parse_block());
          break;
        default:
          unexpected("text or tag");
      }
    }
    return nodes;
  }

  ast::node
  parser::parse_block() {
    if (peek_is(0, token_kind::kw_for)) return parse_for();
    if (peek_is(0, token_kind::kw_if)) return parse_if();
    unexpected("'for' or 'if'");
  }

  // {% for target in iterable %} body {% endfor %}
  ast::node
  parser::parse_for() {
    expect(token_kind::kw_for);
    auto target = expect(token_kind::identifier).value;
    expect(token_kind::kw_in);
    auto iterable = expect(token_kind::identifier).value;
    expect(token_kind::block_end);

    auto body = parse_sequence();

    expect(token_kind::block_start);
    expect(token_kind::kw_endfor);
    expect(token_kind::block_end);

    return ast::for_node{std::move(target), std::move(iterable),
                         std::move(body)};
  }

  // {% if c %} ... ({% elif c %} ...)* ({% else %} ...)? {% endif %}
  ast::node
  parser::parse_if() {
    expect(token_kind::kw_if);
    auto condition = parse_expr();
    expect(token_kind::block_end);

    ast::if_node result;
    result.branches.push_back({std::move(condition), parse_sequence()});

    while (true) {
      if (!peek_is(0, token_kind::block_start))
        unexpected("'{%' of 'elif', 'else' or 'endif'");

      auto keyword = peek(1);
      auto kind = keyword ? keyword->kind : token_kind::block_start;

      if (kind == token_kind::kw_elif) {
        consume();
        consume();
        auto cond = parse_expr();
        expect(token_kind::block_end);
        result.branches.push_back({std::move(cond), parse_sequence()});
      } else if (kind == token_kind::kw_else) {
        consume();
        consume();
        expect(token_kind::block_end);
        result.else_body = parse_sequence();
        expect(token_kind::block_start);
        expect(token_kind::kw_endif);
        expect(token_kind::block_end);
        break;
      } else if (kind == token_kind::kw_endif) {
        consume();
        consume();
        expect(token_kind::block_end);
        break;
      } else {
        consume(); // '{%', so the error points at the keyword
        unexpected("'elif', 'else' or 'endif'");
      }
    }

    return ast::node(std::move(result));
  }

  // -------------------------------------------------------------------------
  // Expressions, weakest binding first
  // -------------------------------------------------------------------------

  ast::expression
  parser::parse_expr() {
    return parse_or();
  }

  ast::expression
  parser::parse_or() {
    auto lhs = parse_and();
    while (peek_is(0, token_kind::kw_or)) {
      consume();
      auto rhs = parse_and();
      lhs = make_binary(std::move(lhs), ast::binary_operator::logical_or,
                        std::move(rhs));
    }
    return lhs;
  }

  ast::expression
  parser::parse_and() {
    auto lhs = parse_equality();
    while (peek_is(0, token_kind::kw_and)) {
      consume();
      auto rhs = parse_equality();
      lhs = make_binary(std::move(lhs), ast::binary_operator::logical_and,
                        std::move(rhs));
    }
    return lhs;
  }

  ast::expression
  parser::parse_equality() {
    auto lhs = parse_concat();
    while (peek_is(0, token_kind::eq_eq)) {
      consume();
      auto rhs = parse_concat();
      lhs = make_binary(std::move(lhs), ast::binary_operator::equals,
                        std::move(rhs));
    }
    return lhs;
  }

  ast::expression
  parser::parse_concat() {
    auto lhs = parse_primary();
    while (peek_is(0, token_kind::plus)) {
      consume();
      auto rhs = parse_primary();
      lhs = make_binary(std::move(lhs), ast::binary_operator::add,
                        std::move(rhs));
    }
    return lhs;
  }

  // primary := STRING | 'true' | 'false' | IDENT | '(' expr ')'
  //            followed by ('.' IDENT | '[' expr ']')*
  ast::expression
  parser::parse_primary() {
    auto tok = peek(0);
    if (tok == nullptr) unexpected("expression");

    switch (tok->kind) {
      case token_kind::string_literal:
        return parse_postfix(ast::string_literal{consume().value});
      case token_kind::kw_true:
        consume();
        return parse_postfix(ast::bool_literal{true});
      case token_kind::kw_false:
        consume();
        return parse_postfix(ast::bool_literal{false});
      case token_kind::identifier:
        return parse_postfix(ast::variable{consume().value});
      case token_kind::lparen: {
        consume();
        auto inner = parse_expr();
        expect(token_kind::rparen);
        return parse_postfix(std::move(inner));
      }
      default:
        unexpected("expression");
    }
  }

  ast::expression
  parser::parse_postfix(ast::expression base) {
    while (true) {
      if (peek_is(0, token_kind::dot)) {
        consume();
        if (!peek_is(0, token_kind::identifier))
          unexpected("identifier after '.'");
        auto name = consume().value;
        base = ast::attribute_access{ast::make_expression(std::move(base)),
                                     std::move(name)};
      } else if (peek_is(0, token_kind::lbracket)) {
        consume();
        auto index = parse_expr();
        expect(token_kind::rbracket);
        base = ast::index_access{ast::make_expression(std::move(base)),
                                 ast::make_expression(std::move(index))};
      } else {
        return base;
      }
    }
  }

  ast::template_body
  parse_template(std::string_view source) {
    parser p{tokenizer(source)};
    return p.parse();
  }

} // namespace chattpl
