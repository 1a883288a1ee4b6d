#pragma once

#include <chattpl/ast.hpp>
#include <chattpl/evaluator.hpp>
#include <chattpl/value.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace chattpl {

  struct chat_message {
    std::string role;
    std::string content;
  };

  // Named string variables and boolean flags injected as top-level
  // bindings next to `messages`.
  class render_context {
  public:
    void
    set_var(const std::string& name, const std::string& value);

    void
    set_flag(const std::string& name, bool value);

    const std::map<std::string, std::string>&
    vars() const {
      return vars_;
    }

    const std::map<std::string, bool>&
    flags() const {
      return flags_;
    }

  private:
    std::map<std::string, std::string> vars_;
    std::map<std::string, bool> flags_;
  };

  // eos_token = "</s>", add_generation_prompt = true.
  render_context
  default_render_context();

  // Base scope: `messages` as a list of {role, content} mappings plus every
  // variable and flag of ctx.
  scope
  make_base_scope(const std::vector<chat_message>& messages,
                  const render_context& ctx);

  // A parsed template, rendered any number of times. Construction throws
  // lex_error or parse_error.
  class chat_template {
  public:
    explicit chat_template(std::string_view source);

    std::string
    render(const std::vector<chat_message>& messages,
           const render_context& ctx) const;

    // Render against an arbitrary base scope.
    std::string
    render(scope base) const;

    const ast::template_body&
    body() const {
      return body_;
    }

  private:
    ast::template_body body_;
  };

  // Render with default_render_context().
  std::string
  render_chat_template(std::string_view source,
                       const std::vector<chat_message>& messages);

  std::string
  render_chat_template(std::string_view source,
                       const std::vector<chat_message>& messages,
                       const render_context& ctx);

} // namespace chattpl
