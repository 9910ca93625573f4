#pragma once

// =============================================================================
// Flamingo - Variable Tree
// =============================================================================
//
// Declares the tunable variables and their conditional structure. A variable
// may name a parent and an activation value; it then takes part in a
// valuation only when the parent is assigned exactly that value.
//
// Declaration grammar:
//
//   tree  := decl ( ',' decl )*
//   decl  := NAME [ '[' NAME '=' VALUE ']' ]
//   NAME  := [A-Za-z_][A-Za-z0-9_]*
//   VALUE := any characters except ']' (surrounding spaces trimmed)
//
// Example: "threads, blocks[threads=64], unroll"
//
// Parents are declared before their children, so the structure is a forest.
//

#include "flamingo/error.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace flamingo {
namespace tuner {

/// Value-domain map: variable name -> ordered legal values
using DomainMap = std::map<std::string, std::vector<std::string>>;

/// One declaration as written by the user
struct VariableDecl {
    std::string name;
    std::string parent;            // Empty for a root
    std::string activation_value;  // Parent value that activates this variable

    [[nodiscard]] bool hasParent() const { return !parent.empty(); }
};

/// A validated variable node
struct Variable {
    std::string name;
    std::vector<std::string> domain;
    std::optional<size_t> parent;       // Index into the tree's variables
    std::string activation_value;       // Only meaningful with a parent
    size_t activation_index = 0;        // Position of activation_value in the parent's domain
    std::vector<size_t> children;       // Declaration order

    [[nodiscard]] bool isRoot() const { return !parent.has_value(); }
};

// =============================================================================
// VariableTree
// =============================================================================

class VariableTree {
  public:
    VariableTree() = default;

    /// Validate declarations against the domain map
    [[nodiscard]] static Result<VariableTree> build(const std::vector<VariableDecl>& decls,
                                                    const DomainMap& domains);

    /// Parse a declaration string and build the tree
    [[nodiscard]] static Result<VariableTree> parse(std::string_view declaration,
                                                    const DomainMap& domains);

    /// Parse a declaration string without validating domains
    [[nodiscard]] static Result<std::vector<VariableDecl>>
    parseDeclaration(std::string_view declaration);

    // -------------------------------------------------------------------------
    // Structure
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t numVariables() const { return variables_.size(); }
    [[nodiscard]] bool empty() const { return variables_.empty(); }

    /// Variables in declaration order
    [[nodiscard]] const std::vector<Variable>& variables() const { return variables_; }
    [[nodiscard]] const Variable& variable(size_t index) const { return variables_[index]; }

    [[nodiscard]] const std::vector<size_t>& roots() const { return roots_; }

    /// Variable indices in pre-order (roots and siblings in declaration order)
    [[nodiscard]] const std::vector<size_t>& preorder() const { return preorder_; }

    [[nodiscard]] std::optional<size_t> indexOf(std::string_view name) const;
    [[nodiscard]] const Variable* find(std::string_view name) const;

    /// Pre-order variable names; this is the result-log column order
    [[nodiscard]] std::vector<std::string> flatten() const;

    // -------------------------------------------------------------------------
    // Rendering
    // -------------------------------------------------------------------------

    /// Indented text tree, one variable per line with its domain
    [[nodiscard]] std::string render() const;

    /// Canonical declaration string (re-parses to the same tree)
    [[nodiscard]] std::string declaration() const;

  private:
    std::vector<Variable> variables_;
    std::vector<size_t> roots_;
    std::vector<size_t> preorder_;
    std::unordered_map<std::string, size_t> index_;

    void computePreorder();
};

}  // namespace tuner
}  // namespace flamingo
