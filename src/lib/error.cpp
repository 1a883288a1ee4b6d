#include <chattpl/error.hpp>

namespace chattpl {

  std::string_view
  to_string(eval_error_kind kind) {
    switch (kind) {
      case eval_error_kind::not_a_mapping:
        return "not a mapping";
      case eval_error_kind::missing_key:
        return "missing key";
      case eval_error_kind::index_out_of_range:
        return "index out of range";
      case eval_error_kind::invalid_index:
        return "invalid index";
      case eval_error_kind::invalid_index_target:
        return "invalid index target";
      case eval_error_kind::unsupported_operand:
        return "unsupported operand";
      case eval_error_kind::unrenderable_value:
        return "unrenderable value";
      case eval_error_kind::not_iterable:
        return "not iterable";
    }
    return "unknown";
  }

  int
  line_at(std::string_view source, std::size_t offset) {
    int line = 1;
    for (std::size_t i = 0; i < offset && i < source.size(); ++i)
      if (source[i] == '\n') ++line;
    return line;
  }

} // namespace chattpl
