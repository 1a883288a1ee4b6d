#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chattpl {

  enum class token_kind {
    text,        // literal template text between tags
    block_start, // {%
    block_end,   // %}
    var_start,   // {{
    var_end,     // }}
    kw_if,
    kw_elif,
    kw_else,
    kw_endif,
    kw_for,
    kw_in,
    kw_endfor,
    kw_and,
    kw_or,
    kw_true,
    kw_false,
    eq_eq,    // ==
    plus,     // +
    dot,      // .
    lbracket, // [
    rbracket, // ]
    lparen,   // (
    rparen,   // )
    identifier,
    string_literal, // decoded contents, quotes stripped
  };

  struct token {
    token_kind kind = token_kind::text;
    std::string value;
    std::size_t offset = 0;
  };

  // Display name used in diagnostics, e.g. "'endfor'" or "identifier".
  std::string
  to_string(token_kind kind);

  // Display form of a concrete token, including its text where useful.
  std::string
  describe(const token& tok);

} // namespace chattpl
