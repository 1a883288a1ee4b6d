#pragma once

#include <chattpl/token.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace chattpl {

  enum class scan_mode { text, tag };

  // Complete resumable state of a scan over a fixed input.
  struct scan_state {
    std::size_t cursor = 0;
    scan_mode mode = scan_mode::text;

    bool
    operator==(const scan_state&) const = default;
  };

  // Lazily splits template text into tokens. The input must outlive the
  // tokenizer. Once exhausted (or after a lex_error) it yields nothing
  // further; scanning again requires a fresh tokenizer.
  class tokenizer {
  public:
    explicit tokenizer(std::string_view input, scan_state state = {});

    // Next token, or std::nullopt at end of input.
    // Throws lex_error on an unterminated string literal.
    std::optional<token>
    next();

    scan_state
    state() const {
      return state_;
    }

    std::string_view
    input() const {
      return input_;
    }

  private:
    std::string_view input_;
    scan_state state_;
    bool failed_ = false;

    std::optional<token>
    scan_text();

    std::optional<token>
    scan_tag();

    token
    read_string_literal();

    token
    read_word();

    void
    trim_line_terminator();

    bool
    at(std::string_view s) const;
  };

  // Scan the whole input. Throws lex_error on an unterminated string.
  std::vector<token>
  tokenize(std::string_view input);

} // namespace chattpl
