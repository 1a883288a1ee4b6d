#include <chattpl/tokenizer.hpp>

#include <chattpl/error.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace chattpl {

  namespace {

    const std::unordered_map<std::string_view, token_kind> keywords = {
        {"if", token_kind::kw_if},       {"elif", token_kind::kw_elif},
        {"else", token_kind::kw_else},   {"endif", token_kind::kw_endif},
        {"for", token_kind::kw_for},     {"in", token_kind::kw_in},
        {"endfor", token_kind::kw_endfor}, {"and", token_kind::kw_and},
        {"or", token_kind::kw_or},       {"true", token_kind::kw_true},
        {"false", token_kind::kw_false},
    };

    // Bytes of multi-byte UTF-8 sequences count as letters, so non-ASCII
    // identifiers stay whole.
    bool
    is_non_ascii(char c) {
      return static_cast<unsigned char>(c) >= 0x80;
    }

    bool
    is_word_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
             is_non_ascii(c);
    }

    bool
    is_word_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
             is_non_ascii(c);
    }

    token_kind
    symbol_kind(char c) {
      switch (c) {
        case '+':
          return token_kind::plus;
        case '.':
          return token_kind::dot;
        case '[':
          return token_kind::lbracket;
        case ']':
          return token_kind::rbracket;
        case '(':
          return token_kind::lparen;
        case ')':
          return token_kind::rparen;
      }
      throw std::logic_error(std::string("not a symbol: ") + c);
    }

  } // namespace

  // -------------------------------------------------------------------------
  // Token display
  // -------------------------------------------------------------------------

  std::string
  to_string(token_kind kind) {
    switch (kind) {
      case token_kind::text:
        return "text";
      case token_kind::block_start:
        return "'{%'";
      case token_kind::block_end:
        return "'%}'";
      case token_kind::var_start:
        return "'{{'";
      case token_kind::var_end:
        return "'}}'";
      case token_kind::kw_if:
        return "'if'";
      case token_kind::kw_elif:
        return "'elif'";
      case token_kind::kw_else:
        return "'else'";
      case token_kind::kw_endif:
        return "'endif'";
      case token_kind::kw_for:
        return "'for'";
      case token_kind::kw_in:
        return "'in'";
      case token_kind::kw_endfor:
        return "'endfor'";
      case token_kind::kw_and:
        return "'and'";
      case token_kind::kw_or:
        return "'or'";
      case token_kind::kw_true:
        return "'true'";
      case token_kind::kw_false:
        return "'false'";
      case token_kind::eq_eq:
        return "'=='";
      case token_kind::plus:
        return "'+'";
      case token_kind::dot:
        return "'.'";
      case token_kind::lbracket:
        return "'['";
      case token_kind::rbracket:
        return "']'";
      case token_kind::lparen:
        return "'('";
      case token_kind::rparen:
        return "')'";
      case token_kind::identifier:
        return "identifier";
      case token_kind::string_literal:
        return "string literal";
    }
    return "unknown token";
  }

  std::string
  describe(const token& tok) {
    switch (tok.kind) {
      case token_kind::identifier:
        return "identifier '" + tok.value + "'";
      case token_kind::string_literal:
        return "string literal '" + tok.value + "'";
      case token_kind::text:
        return "text";
      default:
        return to_string(tok.kind);
    }
  }

  // -------------------------------------------------------------------------
  // Tokenizer
  // -------------------------------------------------------------------------

  tokenizer::tokenizer(std::string_view input, scan_state state)
      : input_(input), state_(state) {}

  std::optional<token>
  tokenizer::next() {
    if (failed_ || state_.cursor >= input_.size()) return std::nullopt;
    return state_.mode == scan_mode::text ? scan_text() : scan_tag();
  }

  bool
  tokenizer::at(std::string_view s) const {
    return input_.substr(state_.cursor).starts_with(s);
  }

  std::optional<token>
  tokenizer::scan_text() {
    auto start = state_.cursor;
    auto next_tag = std::min(input_.find("{%", start), input_.find("{{", start));

    if (next_tag == start) {
      auto kind = at("{%") ? token_kind::block_start : token_kind::var_start;
      state_.cursor += 2;
      state_.mode = scan_mode::tag;
      return token{kind, std::string(input_.substr(start, 2)), start};
    }

    auto end = next_tag == std::string_view::npos ? input_.size() : next_tag;
    state_.cursor = end;
    return token{token_kind::text,
                 std::string(input_.substr(start, end - start)), start};
  }

  std::optional<token>
  tokenizer::scan_tag() {
    while (true) {
      while (state_.cursor < input_.size() &&
             std::isspace(static_cast<unsigned char>(input_[state_.cursor])))
        ++state_.cursor;
      if (state_.cursor >= input_.size()) return std::nullopt;

      auto start = state_.cursor;

      if (at("%}")) {
        state_.cursor += 2;
        state_.mode = scan_mode::text;
        trim_line_terminator();
        return token{token_kind::block_end, "%}", start};
      }
      if (at("}}")) {
        state_.cursor += 2;
        state_.mode = scan_mode::text;
        return token{token_kind::var_end, "}}", start};
      }
      if (at("==")) {
        state_.cursor += 2;
        return token{token_kind::eq_eq, "==", start};
      }

      char c = input_[start];
      switch (c) {
        case '+':
        case '.':
        case '[':
        case ']':
        case '(':
        case ')':
          ++state_.cursor;
          return token{symbol_kind(c), std::string(1, c), start};
        case '\'':
        case '"':
          return read_string_literal();
        default:
          break;
      }

      if (is_word_start(c)) return read_word();

      // Anything else inside a tag is ignored.
      ++state_.cursor;
    }
  }

  token
  tokenizer::read_string_literal() {
    auto start = state_.cursor;
    char quote = input_[start];
    auto pos = start + 1;
    std::string value;

    while (pos < input_.size()) {
      char c = input_[pos++];
      if (c == quote) {
        state_.cursor = pos;
        return token{token_kind::string_literal, std::move(value), start};
      }
      if (c != '\\') {
        value += c;
        continue;
      }
      if (pos >= input_.size()) break;
      char esc = input_[pos++];
      switch (esc) {
        case 'n':
          value += '\n';
          break;
        case 't':
          value += '\t';
          break;
        default:
          value += esc;
          break;
      }
    }

    failed_ = true;
    state_.cursor = input_.size();
    throw lex_error("unterminated string literal", start,
                    line_at(input_, start));
  }

  token
  tokenizer::read_word() {
    auto start = state_.cursor;
    while (state_.cursor < input_.size() && is_word_char(input_[state_.cursor]))
      ++state_.cursor;

    auto word = input_.substr(start, state_.cursor - start);
    auto it = keywords.find(word);
    if (it != keywords.end()) return token{it->second, std::string(word), start};
    return token{token_kind::identifier, std::string(word), start};
  }

  // trim_blocks: drop exactly one line terminator after '%}'.
  void
  tokenizer::trim_line_terminator() {
    if (at("\n"))
      state_.cursor += 1;
    else if (at("\r\n"))
      state_.cursor += 2;
  }

  std::vector<token>
  tokenize(std::string_view input) {
    std::vector<token> tokens;
    tokenizer lex(input);
    while (auto tok = lex.next())
      tokens.push_back(std::move(*tok));
    return tokens;
  }

} // namespace chattpl
