#pragma once

#include <chattpl/chat_template.hpp>
#include <chattpl/value.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace chattpl {

  // JSON numbers become their decimal text; there is no numeric value kind.
  value
  to_value(const nlohmann::json& j);

  // Accepts an array of {"role", "content"} objects, or an object holding
  // such an array under "messages". Throws context_error otherwise.
  std::vector<chat_message>
  messages_from_json(const nlohmann::json& j);

  // Bind every entry of a JSON object in ctx. Strings and numbers become
  // variables, booleans become flags and nulls are skipped. Lists, objects
  // and the name "messages" throw context_error.
  void
  apply_variables(const nlohmann::json& j, render_context& ctx);

  // The parts of a Hugging Face tokenizer_config.json used for rendering.
  struct tokenizer_config {
    std::optional<std::string> chat_template;
    std::optional<std::string> bos_token;
    std::optional<std::string> eos_token;
    std::optional<std::string> unk_token;
    std::optional<std::string> pad_token;

    // Set every special token that is present as a string variable.
    void
    apply(render_context& ctx) const;
  };

  // template_name selects among named templates when chat_template is a
  // list of {"name", "template"} entries.
  tokenizer_config
  tokenizer_config_from_json(const nlohmann::json& j,
                             const std::string& template_name = "default");

} // namespace chattpl
