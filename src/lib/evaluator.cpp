#include <chattpl/evaluator.hpp>

#include <chattpl/error.hpp>

#include <charconv>
#include <system_error>
#include <type_traits>
#include <utility>

namespace chattpl {

  namespace {

    // Pops the per-iteration loop scope on every exit path.
    class scope_guard {
    public:
      scope_guard(scope_stack& stack, scope s) : stack_(stack) {
        stack_.push(std::move(s));
      }

      ~scope_guard() { stack_.pop(); }

      scope_guard(const scope_guard&) = delete;
      scope_guard&
      operator=(const scope_guard&) = delete;

    private:
      scope_stack& stack_;
    };

    value
    make_loop_info(std::size_t position, std::size_t length) {
      return value_map{
          {"first", position == 0},
          {"last", position + 1 == length},
          {"index0", std::to_string(position)},
          {"index", std::to_string(position + 1)},
          {"length", std::to_string(length)},
      };
    }

    void
    append_rendered(const value& v, std::string& out) {
      std::visit(
          [&](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::string>)
              out += x;
            else if constexpr (std::is_same_v<T, bool>)
              out += x ? "true" : "false";
            else if constexpr (std::is_same_v<T, null_value>)
              return;
            else
              throw render_error(eval_error_kind::unrenderable_value,
                                 "cannot render a " +
                                     std::string(kind_name(v)) +
                                     " value directly");
          },
          v.data());
    }

    value
    list_element(const value_list& list, const std::string& index) {
      std::size_t position = 0;
      auto first = index.data();
      auto last = index.data() + index.size();
      // One leading '+' is accepted, as in "+1".
      if (first != last && *first == '+') ++first;
      auto [ptr, ec] = std::from_chars(first, last, position);

      if (first == last || ptr != last ||
          (ec != std::errc() && ec != std::errc::result_out_of_range))
        throw render_error(eval_error_kind::invalid_index,
                           "list index must be a non-negative integer, got '" +
                               index + "'");
      if (ec == std::errc::result_out_of_range || position >= list.size())
        throw render_error(eval_error_kind::index_out_of_range,
                           "index " + index + " out of range for list of " +
                               std::to_string(list.size()) + " element(s)");
      return list[position];
    }

  } // namespace

  // -------------------------------------------------------------------------
  // scope_stack
  // -------------------------------------------------------------------------

  scope_stack::scope_stack(scope base) {
    scopes_.push_back(std::move(base));
  }

  value
  scope_stack::lookup(std::string_view name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
      auto found = it->find(std::string(name));
      if (found != it->end()) return found->second;
    }
    return null_value{};
  }

  void
  scope_stack::push(scope s) {
    scopes_.push_back(std::move(s));
  }

  void
  scope_stack::pop() {
    // The base scope stays for the lifetime of the stack.
    if (scopes_.size() > 1) scopes_.pop_back();
  }

  // -------------------------------------------------------------------------
  // Statements
  // -------------------------------------------------------------------------

  evaluator::evaluator(scope base) : scopes_(std::move(base)) {}

  std::string
  evaluator::render(const ast::template_body& body) {
    std::string out;
    render_into(body, out);
    return out;
  }

  void
  evaluator::render_into(const ast::template_body& body, std::string& out) {
    for (const auto& n : body)
      render_node(n, out);
  }

  void
  evaluator::render_node(const ast::node& n, std::string& out) {
    std::visit(
        [&](const auto& x) {
          using T = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<T, ast::text_node>)
            out += x.text;
          else if constexpr (std::is_same_v<T, ast::output_node>)
            append_rendered(evaluate(x.expr), out);
          else if constexpr (std::is_same_v<T, ast::for_node>)
            render_for(x, out);
          else
            render_if(x, out);
        },
        n.data());
  }

  void
  evaluator::render_for(const ast::for_node& n, std::string& out) {
    auto iterable = scopes_.lookup(n.iterable);
    if (iterable.is_null()) return;

    if (!iterable.holds<value_list>())
      throw render_error(eval_error_kind::not_iterable,
                         "cannot iterate over '" + n.iterable + "' (a " +
                             std::string(kind_name(iterable)) + ")");

    const auto& items = iterable.get<value_list>();
    for (std::size_t i = 0; i < items.size(); ++i) {
      scope_guard guard(scopes_,
                        scope{{n.target, items[i]},
                              {"loop", make_loop_info(i, items.size())}});
      render_into(n.body, out);
    }
  }

  // Branches share the enclosing scope.
  void
  evaluator::render_if(const ast::if_node& n, std::string& out) {
    for (const auto& branch : n.branches) {
      if (is_truthy(evaluate(branch.condition))) {
        render_into(branch.body, out);
        return;
      }
    }
    if (n.else_body) render_into(*n.else_body, out);
  }

  // -------------------------------------------------------------------------
  // Expressions
  // -------------------------------------------------------------------------

  value
  evaluator::evaluate(const ast::expression& expr) {
    return std::visit(
        [&](const auto& x) -> value {
          using T = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<T, ast::string_literal>)
            return x.value;
          else if constexpr (std::is_same_v<T, ast::bool_literal>)
            return x.value;
          else if constexpr (std::is_same_v<T, ast::variable>)
            return scopes_.lookup(x.name);
          else if constexpr (std::is_same_v<T, ast::attribute_access>)
            return evaluate_attribute(x);
          else if constexpr (std::is_same_v<T, ast::index_access>)
            return evaluate_index(x);
          else
            return evaluate_binary(x);
        },
        expr.data());
  }

  value
  evaluator::evaluate_attribute(const ast::attribute_access& e) {
    auto base = evaluate(*e.base);
    if (!base.holds<value_map>())
      throw render_error(eval_error_kind::not_a_mapping,
                         "cannot get attribute '" + e.name + "' of a " +
                             std::string(kind_name(base)) + " value");

    const auto& map = base.get<value_map>();
    auto it = map.find(e.name);
    if (it == map.end())
      throw render_error(eval_error_kind::missing_key,
                         "attribute '" + e.name + "' not found");
    return it->second;
  }

  value
  evaluator::evaluate_index(const ast::index_access& e) {
    auto base = evaluate(*e.base);
    auto index = evaluate(*e.index);

    if (index.holds<std::string>()) {
      const auto& key = index.get<std::string>();
      if (base.holds<value_map>()) {
        const auto& map = base.get<value_map>();
        auto it = map.find(key);
        if (it == map.end())
          throw render_error(eval_error_kind::missing_key,
                             "key '" + key + "' not found");
        return it->second;
      }
      if (base.holds<value_list>())
        return list_element(base.get<value_list>(), key);
    }

    throw render_error(eval_error_kind::invalid_index_target,
                       "cannot index a " + std::string(kind_name(base)) +
                           " value with a " + std::string(kind_name(index)) +
                           " index");
  }

  // Both operands are always evaluated; 'and' and 'or' do not short-circuit.
  value
  evaluator::evaluate_binary(const ast::binary_op& e) {
    auto lhs = evaluate(*e.lhs);
    auto rhs = evaluate(*e.rhs);

    switch (e.op) {
      case ast::binary_operator::equals:
        return lhs == rhs;
      case ast::binary_operator::add:
        if (!lhs.holds<std::string>() || !rhs.holds<std::string>())
          throw render_error(eval_error_kind::unsupported_operand,
                             "'+' needs two strings, got " +
                                 std::string(kind_name(lhs)) + " and " +
                                 std::string(kind_name(rhs)));
        return lhs.get<std::string>() + rhs.get<std::string>();
      case ast::binary_operator::logical_and:
        return is_truthy(lhs) && is_truthy(rhs);
      case ast::binary_operator::logical_or:
        return is_truthy(lhs) || is_truthy(rhs);
    }
    return null_value{};
  }

  std::string
  render(const ast::template_body& body, scope base) {
    evaluator ev(std::move(base));
    return ev.render(body);
  }

} // namespace chattpl
