#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chattpl {

  // Base of every failure raised while compiling or rendering a template.
  class template_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Unterminated string literal inside a tag.
  class lex_error : public template_error {
  public:
    lex_error(const std::string& msg, std::size_t offset, int line)
        : template_error("lex error (line " + std::to_string(line) +
                         "): " + msg),
          offset_(offset), line_(line) {}

    std::size_t
    offset() const {
      return offset_;
    }

    int
    line() const {
      return line_;
    }

  private:
    std::size_t offset_;
    int line_;
  };

  class parse_error : public template_error {
  public:
    parse_error(const std::string& msg, int line)
        : template_error("parse error (line " + std::to_string(line) +
                         "): " + msg),
          line_(line) {}

    int
    line() const {
      return line_;
    }

  private:
    int line_;
  };

  enum class eval_error_kind {
    not_a_mapping,        // attribute access on a non-mapping
    missing_key,          // attribute or key absent from a mapping
    index_out_of_range,   // list position past the end
    invalid_index,        // list index that is not a non-negative integer
    invalid_index_target, // unsupported base/index combination
    unsupported_operand,  // '+' on anything but two strings
    unrenderable_value,   // interpolating a list or mapping
    not_iterable,         // for-loop over a non-list
  };

  std::string_view
  to_string(eval_error_kind kind);

  class render_error : public template_error {
  public:
    render_error(eval_error_kind kind, const std::string& msg)
        : template_error("render error (" + std::string(to_string(kind)) +
                         "): " + msg),
          kind_(kind) {}

    eval_error_kind
    kind() const {
      return kind_;
    }

  private:
    eval_error_kind kind_;
  };

  // Malformed caller-supplied context (messages, variables, config).
  class context_error : public template_error {
  public:
    using template_error::template_error;
  };

  // 1-based line number of a byte offset within source.
  int
  line_at(std::string_view source, std::size_t offset);

} // namespace chattpl
