#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace chattpl {

  class value;

  struct null_value {
    bool
    operator==(const null_value&) const = default;
  };

  using value_list = std::vector<value>;
  using value_map = std::map<std::string, value>;

  // Runtime value of the evaluator. Only strings, booleans and null render
  // directly; lists and mappings are reached through attribute or index
  // access.
  class value {
  public:
    using variant_type =
        std::variant<null_value, std::string, bool, value_list, value_map>;

    value() = default;

    value(null_value v) : data_(v) {}

    value(std::string v) : data_(std::move(v)) {}

    value(const char* v) : data_(std::string(v)) {}

    value(bool v) : data_(v) {}

    value(value_list v) : data_(std::move(v)) {}

    value(value_map v) : data_(std::move(v)) {}

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    bool
    is_null() const {
      return holds<null_value>();
    }

    // Same kind and same content, recursively.
    friend bool
    operator==(const value& a, const value& b);

  private:
    variant_type data_;
  };

  bool
  is_truthy(const value& v);

  // "string", "boolean", "list", "mapping" or "null".
  std::string_view
  kind_name(const value& v);

} // namespace chattpl
