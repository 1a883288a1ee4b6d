#include <chattpl/json_context.hpp>

#include <chattpl/error.hpp>

#include <utility>

namespace chattpl {

  namespace {

    std::string
    message_field(const nlohmann::json& entry, std::size_t index,
                  const char* field) {
      auto it = entry.find(field);
      if (it == entry.end())
        throw context_error("message " + std::to_string(index) +
                            " has no \"" + field + "\"");
      if (!it->is_string())
        throw context_error("message " + std::to_string(index) + " field \"" +
                            field + "\" must be a string, got " +
                            it->type_name());
      return it->get<std::string>();
    }

    // Special tokens are either plain strings or AddedToken objects
    // carrying the text under "content".
    std::optional<std::string>
    special_token(const nlohmann::json& j, const char* name) {
      auto it = j.find(name);
      if (it == j.end() || it->is_null()) return std::nullopt;
      if (it->is_string()) return it->get<std::string>();
      if (it->is_object() && it->contains("content") &&
          (*it)["content"].is_string())
        return (*it)["content"].get<std::string>();
      throw context_error(std::string("\"") + name +
                          "\" must be a string or an object with \"content\"");
    }

    std::optional<std::string>
    select_template(const nlohmann::json& j, const std::string& name) {
      auto it = j.find("chat_template");
      if (it == j.end() || it->is_null()) return std::nullopt;
      if (it->is_string()) return it->get<std::string>();
      if (!it->is_array())
        throw context_error("\"chat_template\" must be a string or a list");

      for (const auto& entry : *it) {
        if (!entry.is_object()) continue;
        auto entry_name = entry.find("name");
        auto entry_template = entry.find("template");
        if (entry_name != entry.end() && entry_name->is_string() &&
            *entry_name == name && entry_template != entry.end() &&
            entry_template->is_string())
          return entry_template->get<std::string>();
      }
      throw context_error("no chat template named '" + name + "'");
    }

  } // namespace

  value
  to_value(const nlohmann::json& j) {
    switch (j.type()) {
      case nlohmann::json::value_t::null:
      case nlohmann::json::value_t::discarded:
        return null_value{};
      case nlohmann::json::value_t::boolean:
        return j.get<bool>();
      case nlohmann::json::value_t::string:
        return j.get<std::string>();
      case nlohmann::json::value_t::array: {
        value_list list;
        list.reserve(j.size());
        for (const auto& item : j)
          list.push_back(to_value(item));
        return list;
      }
      case nlohmann::json::value_t::object: {
        value_map map;
        for (auto it = j.begin(); it != j.end(); ++it)
          map.emplace(it.key(), to_value(it.value()));
        return map;
      }
      default:
        // number_integer, number_unsigned, number_float
        return j.dump();
    }
  }

  std::vector<chat_message>
  messages_from_json(const nlohmann::json& j) {
    const nlohmann::json* list = &j;
    if (j.is_object()) {
      auto it = j.find("messages");
      if (it == j.end())
        throw context_error("expected a \"messages\" array in object");
      list = &*it;
    }
    if (!list->is_array())
      throw context_error(std::string("messages must be an array, got ") +
                          list->type_name());

    std::vector<chat_message> messages;
    messages.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
      const auto& entry = (*list)[i];
      if (!entry.is_object())
        throw context_error("message " + std::to_string(i) +
                            " must be an object, got " + entry.type_name());
      messages.push_back({message_field(entry, i, "role"),
                          message_field(entry, i, "content")});
    }
    return messages;
  }

  void
  apply_variables(const nlohmann::json& j, render_context& ctx) {
    if (!j.is_object())
      throw context_error(std::string("variables must be a JSON object, got ") +
                          j.type_name());

    for (auto it = j.begin(); it != j.end(); ++it) {
      auto v = to_value(it.value());
      if (v.is_null()) continue;
      if (v.holds<std::string>())
        ctx.set_var(it.key(), v.get<std::string>());
      else if (v.holds<bool>())
        ctx.set_flag(it.key(), v.get<bool>());
      else
        throw context_error("variable \"" + it.key() +
                            "\" must be a string, number or boolean, got " +
                            std::string(kind_name(v)));
    }
  }

  void
  tokenizer_config::apply(render_context& ctx) const {
    if (bos_token) ctx.set_var("bos_token", *bos_token);
    if (eos_token) ctx.set_var("eos_token", *eos_token);
    if (unk_token) ctx.set_var("unk_token", *unk_token);
    if (pad_token) ctx.set_var("pad_token", *pad_token);
  }

  tokenizer_config
  tokenizer_config_from_json(const nlohmann::json& j,
                             const std::string& template_name) {
    if (!j.is_object())
      throw context_error("tokenizer config must be a JSON object");

    tokenizer_config cfg;
    cfg.chat_template = select_template(j, template_name);
    cfg.bos_token = special_token(j, "bos_token");
    cfg.eos_token = special_token(j, "eos_token");
    cfg.unk_token = special_token(j, "unk_token");
    cfg.pad_token = special_token(j, "pad_token");
    return cfg;
  }

} // namespace chattpl
