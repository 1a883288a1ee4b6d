#pragma once

#include <chattpl/ast.hpp>
#include <chattpl/tokenizer.hpp>

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace chattpl {

  // Recursive descent parser over a token stream with two tokens of
  // lookahead. Throws parse_error on malformed input; lex_error from the
  // underlying tokenizer propagates unchanged.
  class parser {
  public:
    explicit parser(tokenizer lex);

    // Parse the whole input as a template.
    ast::template_body
    parse();

  private:
    tokenizer lex_;
    std::deque<token> lookahead_;
    bool exhausted_ = false;

    const token*
    peek(std::size_t n);

    bool
    peek_is(std::size_t n, token_kind k);

    token
    consume();

    token
    expect(token_kind k);

    [[noreturn]] void
    error(const std::string& msg);

    [[noreturn]] void
    unexpected(const std::string& what);

    bool
    at_terminator();

    ast::template_body
    parse_sequence();

    ast::node
    parse_block();

    ast::node
    parse_for();

    ast::node
    parse_if();

    ast::expression
    parse_expr();

    ast::expression
    parse_or();

    ast::expression
    parse_and();

    ast::expression
    parse_equality();

    ast::expression
    parse_concat();

    ast::expression
    parse_primary();

    ast::expression
    parse_postfix(ast::expression base);
  };

  ast::template_body
  parse_template(std::string_view source);

} // namespace chattpl
