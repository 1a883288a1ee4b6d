#include <chattpl/chat_template.hpp>

#include <chattpl/error.hpp>
#include <chattpl/parser.hpp>

#include <utility>

namespace chattpl {

  namespace {

    const std::string messages_name = "messages";

    void
    check_binding_name(const std::string& name) {
      if (name == messages_name)
        throw context_error("'" + messages_name +
                            "' is reserved for the message list");
    }

  } // namespace

  void
  render_context::set_var(const std::string& name, const std::string& value) {
    check_binding_name(name);
    flags_.erase(name);
    vars_[name] = value;
  }

  void
  render_context::set_flag(const std::string& name, bool value) {
    check_binding_name(name);
    vars_.erase(name);
    flags_[name] = value;
  }

  render_context
  default_render_context() {
    render_context ctx;
    ctx.set_var("eos_token", "</s>");
    ctx.set_flag("add_generation_prompt", true);
    return ctx;
  }

  scope
  make_base_scope(const std::vector<chat_message>& messages,
                  const render_context& ctx) {
    value_list list;
    list.reserve(messages.size());
    for (const auto& m : messages)
      list.push_back(value_map{{"role", m.role}, {"content", m.content}});

    scope base;
    base.emplace(messages_name, std::move(list));
    for (const auto& [name, v] : ctx.vars())
      base.emplace(name, v);
    for (const auto& [name, f] : ctx.flags())
      base.emplace(name, f);
    return base;
  }

  chat_template::chat_template(std::string_view source)
      : body_(parse_template(source)) {}

  std::string
  chat_template::render(const std::vector<chat_message>& messages,
                        const render_context& ctx) const {
    return render(make_base_scope(messages, ctx));
  }

  std::string
  chat_template::render(scope base) const {
    return chattpl::render(body_, std::move(base));
  }

  std::string
  render_chat_template(std::string_view source,
                       const std::vector<chat_message>& messages) {
    return render_chat_template(source, messages, default_render_context());
  }

  std::string
  render_chat_template(std::string_view source,
                       const std::vector<chat_message>& messages,
                       const render_context& ctx) {
    chat_template tmpl(source);
    return tmpl.render(messages, ctx);
  }

} // namespace chattpl
