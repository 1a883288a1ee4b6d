#pragma once

#include <chattpl/ast.hpp>
#include <chattpl/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chattpl {

  using scope = value_map;

  // Variable scopes, innermost last. Lookup walks innermost to outermost.
  class scope_stack {
  public:
    explicit scope_stack(scope base);

    // The innermost binding of name, or null when nothing binds it.
    value
    lookup(std::string_view name) const;

    void
    push(scope s);

    void
    pop();

    std::size_t
    depth() const {
      return scopes_.size();
    }

  private:
    std::vector<scope> scopes_;
  };

  // Tree-walking renderer. One evaluator serves one render call; it owns
  // the scope stack seeded with the base scope. Failures throw render_error.
  class evaluator {
  public:
    explicit evaluator(scope base);

    std::string
    render(const ast::template_body& body);

    value
    evaluate(const ast::expression& expr);

    const scope_stack&
    scopes() const {
      return scopes_;
    }

  private:
    scope_stack scopes_;

    void
    render_into(const ast::template_body& body, std::string& out);

    void
    render_node(const ast::node& n, std::string& out);

    void
    render_for(const ast::for_node& n, std::string& out);

    void
    render_if(const ast::if_node& n, std::string& out);

    value
    evaluate_attribute(const ast::attribute_access& e);

    value
    evaluate_index(const ast::index_access& e);

    value
    evaluate_binary(const ast::binary_op& e);
  };

  // Render body against a fresh scope stack seeded with base.
  std::string
  render(const ast::template_body& body, scope base);

} // namespace chattpl
