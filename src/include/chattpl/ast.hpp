#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chattpl::ast {

  // Forward declarations
  class expression;
  class node;

  // ---------------------------------------------------------------------------
  // Expression node types
  // ---------------------------------------------------------------------------

  struct string_literal {
    std::string value;
  };

  struct bool_literal {
    bool value = false;
  };

  struct variable {
    std::string name;
  };

  // base.name
  struct attribute_access {
    std::unique_ptr<expression> base;
    std::string name;
  };

  // base[index]
  struct index_access {
    std::unique_ptr<expression> base;
    std::unique_ptr<expression> index;
  };

  enum class binary_operator { equals, add, logical_and, logical_or };

  struct binary_op {
    std::unique_ptr<expression> lhs;
    binary_operator op = binary_operator::equals;
    std::unique_ptr<expression> rhs;
  };

  // ---------------------------------------------------------------------------
  // Expression
  // ---------------------------------------------------------------------------

  class expression {
  public:
    using variant_type =
        std::variant<string_literal, bool_literal, variable, attribute_access,
                     index_access, binary_op>;

    expression(variant_type v) : data_(std::move(v)) {}

    expression(string_literal v) : data_(std::move(v)) {}

    expression(bool_literal v) : data_(std::move(v)) {}

    expression(variable v) : data_(std::move(v)) {}

    expression(attribute_access v) : data_(std::move(v)) {}

    expression(index_access v) : data_(std::move(v)) {}

    expression(binary_op v) : data_(std::move(v)) {}

    expression(const expression&) = delete;
    expression&
    operator=(const expression&) = delete;
    expression(expression&&) = default;
    expression&
    operator=(expression&&) = default;

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

  private:
    variant_type data_;
  };

  // ---------------------------------------------------------------------------
  // Statement node types
  // ---------------------------------------------------------------------------

  using template_body = std::vector<node>;

  struct text_node {
    std::string text;
  };

  // {{ expr }}
  struct output_node {
    expression expr;
  };

  // {% for target in iterable %} body {% endfor %}
  struct for_node {
    std::string target;
    std::string iterable;
    template_body body;
  };

  struct conditional_branch {
    expression condition;
    template_body body;
  };

  // if/elif branches in source order, then the optional else body.
  struct if_node {
    std::vector<conditional_branch> branches;
    std::optional<template_body> else_body;
  };

  // ---------------------------------------------------------------------------
  // Node
  // ---------------------------------------------------------------------------

  class node {
  public:
    using variant_type = std::variant<text_node, output_node, for_node, if_node>;

    node(variant_type v) : data_(std::move(v)) {}

    node(text_node v) : data_(std::move(v)) {}

    node(output_node v) : data_(std::move(v)) {}

    node(for_node v) : data_(std::move(v)) {}

    node(if_node v) : data_(std::move(v)) {}

    node(const node&) = delete;
    node&
    operator=(const node&) = delete;
    node(node&&) = default;
    node&
    operator=(node&&) = default;

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

  private:
    variant_type data_;
  };

  // ---------------------------------------------------------------------------
  // Factory helpers
  // ---------------------------------------------------------------------------

  template <typename T>
  std::unique_ptr<expression>
  make_expression(T&& e) {
    return std::make_unique<expression>(std::forward<T>(e));
  }

} // namespace chattpl::ast
