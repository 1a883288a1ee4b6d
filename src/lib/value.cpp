#include <chattpl/value.hpp>

#include <type_traits>

namespace chattpl {

  bool
  operator==(const value& a, const value& b) {
    return a.data_ == b.data_;
  }

  bool
  is_truthy(const value& v) {
    return std::visit(
        [](const auto& x) -> bool {
          using T = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<T, null_value>)
            return false;
          else if constexpr (std::is_same_v<T, bool>)
            return x;
          else
            return !x.empty();
        },
        v.data());
  }

  std::string_view
  kind_name(const value& v) {
    return std::visit(
        [](const auto& x) -> std::string_view {
          using T = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<T, null_value>)
            return "null";
          else if constexpr (std::is_same_v<T, std::string>)
            return "string";
          else if constexpr (std::is_same_v<T, bool>)
            return "boolean";
          else if constexpr (std::is_same_v<T, value_list>)
            return "list";
          else
            return "mapping";
        },
        v.data());
  }

} // namespace chattpl
