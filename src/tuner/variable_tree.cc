// =============================================================================
// Flamingo - Variable Tree Implementation
// =============================================================================

#include "flamingo/tuner/variable_tree.h"

#include "flamingo/string_util.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace flamingo {
namespace tuner {

// =============================================================================
// Declaration Parser
// =============================================================================

namespace {

bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class DeclarationParser {
  public:
    explicit DeclarationParser(std::string_view text) : text_(text) {}

    Result<std::vector<VariableDecl>> parse() {
        std::vector<VariableDecl> decls;

        if (trim(text_).empty()) {
            return fail("the variable declaration is empty");
        }

        while (true) {
            skipSpace();
            VariableDecl decl;

            auto name = parseName();
            if (!name) {
                return name.error();
            }
            decl.name = std::move(*name);

            skipSpace();
            if (peek() == '[') {
                ++pos_;
                skipSpace();
                auto parent = parseName();
                if (!parent) {
                    return parent.error();
                }
                decl.parent = std::move(*parent);

                skipSpace();
                if (peek() != '=') {
                    return fail(fmt::format("expected '=' after parent '{}'", decl.parent));
                }
                ++pos_;

                size_t close = text_.find(']', pos_);
                if (close == std::string_view::npos) {
                    return fail(fmt::format("missing ']' in the declaration of '{}'", decl.name));
                }
                decl.activation_value = std::string(trim(text_.substr(pos_, close - pos_)));
                if (decl.activation_value.empty()) {
                    return fail(fmt::format("empty activation value for '{}'", decl.name));
                }
                pos_ = close + 1;
                skipSpace();
            }

            decls.push_back(std::move(decl));

            if (atEnd()) {
                break;
            }
            if (peek() != ',') {
                return fail(fmt::format("unexpected character '{}'", peek()));
            }
            ++pos_;
            skipSpace();
            if (atEnd()) {
                return fail("trailing ',' without a declaration");
            }
        }

        return decls;
    }

  private:
    std::string_view text_;
    size_t pos_ = 0;

    [[nodiscard]] bool atEnd() const { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const { return atEnd() ? '\0' : text_[pos_]; }

    void skipSpace() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    Result<std::string> parseName() {
        if (atEnd() || !isNameStart(text_[pos_])) {
            return fail("expected a variable name");
        }
        size_t start = pos_;
        while (!atEnd() && isNameChar(text_[pos_])) {
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    Error fail(const std::string& what) const {
        return Error(ErrorCode::kConfigurationError,
                     fmt::format("invalid variable declaration at column {}: {}", pos_ + 1, what));
    }
};

}  // namespace

Result<std::vector<VariableDecl>> VariableTree::parseDeclaration(std::string_view declaration) {
    return DeclarationParser(declaration).parse();
}

// =============================================================================
// Construction
// =============================================================================

Result<VariableTree> VariableTree::parse(std::string_view declaration, const DomainMap& domains) {
    auto decls = parseDeclaration(declaration);
    if (!decls) {
        return decls.error();
    }
    return build(*decls, domains);
}

Result<VariableTree> VariableTree::build(const std::vector<VariableDecl>& decls,
                                         const DomainMap& domains) {
    VariableTree tree;
    tree.variables_.reserve(decls.size());

    for (const auto& decl : decls) {
        if (decl.name.empty()) {
            FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError, "variable with an empty name");
        }
        if (tree.index_.count(decl.name) > 0) {
            FLAMINGO_RETURN_ERROR(ErrorCode::kConfigurationError,
                                  fmt::format("variable '{}' is declared twice", decl.name));
        }

        auto domain_it = domains.find(decl.name);
        if (domain_it == domains.end()) {
            FLAMINGO_RETURN_ERROR(
                ErrorCode::kConfigurationError,
                fmt::format("no possible values are given for variable '{}'", decl.name));
        }

        Variable var;
        var.name = decl.name;
        var.domain = domain_it->second;

        if (var.domain.empty()) {
            FLAMINGO_RETURN_ERROR(
                ErrorCode::kConfigurationError,
                fmt::format("variable '{}' has an empty list of possible values", decl.name));
        }
        std::unordered_set<std::string> seen;
        for (const auto& value : var.domain) {
            if (value.empty()) {
                FLAMINGO_RETURN_ERROR(
                    ErrorCode::kConfigurationError,
                    fmt::format("variable '{}' has an empty possible value", decl.name));
            }
            if (!seen.insert(value).second) {
                FLAMINGO_RETURN_ERROR(
                    ErrorCode::kConfigurationError,
                    fmt::format("variable '{}' lists the value '{}' twice", decl.name, value));
            }
        }

        size_t index = tree.variables_.size();

        if (decl.hasParent()) {
            if (decl.parent == decl.name) {
                FLAMINGO_RETURN_ERROR(
                    ErrorCode::kConfigurationError,
                    fmt::format("variable '{}' cannot be its own parent", decl.name));
            }
            auto parent_it = tree.index_.find(decl.parent);
            if (parent_it == tree.index_.end()) {
                FLAMINGO_RETURN_ERROR(
                    ErrorCode::kConfigurationError,
                    fmt::format("variable '{}' depends on '{}', which is not declared before it",
                                decl.name, decl.parent));
            }

            auto& parent = tree.variables_[parent_it->second];
            auto value_it =
                std::find(parent.domain.begin(), parent.domain.end(), decl.activation_value);
            if (value_it == parent.domain.end()) {
                FLAMINGO_RETURN_ERROR(
                    ErrorCode::kConfigurationError,
                    fmt::format("variable '{}' is activated by {} = {}, which is not a possible "
                                "value of '{}'",
                                decl.name, decl.parent, decl.activation_value, decl.parent));
            }

            var.parent = parent_it->second;
            var.activation_value = decl.activation_value;
            var.activation_index = static_cast<size_t>(value_it - parent.domain.begin());
            parent.children.push_back(index);
        } else {
            tree.roots_.push_back(index);
        }

        tree.index_.emplace(var.name, index);
        tree.variables_.push_back(std::move(var));
    }

    for (const auto& [name, values] : domains) {
        if (tree.index_.count(name) == 0) {
            spdlog::warn("Possible values given for undeclared variable '{}' are ignored", name);
        }
    }

    tree.computePreorder();
    return tree;
}

void VariableTree::computePreorder() {
    preorder_.clear();
    preorder_.reserve(variables_.size());

    std::vector<size_t> stack(roots_.rbegin(), roots_.rend());
    while (!stack.empty()) {
        size_t index = stack.back();
        stack.pop_back();
        preorder_.push_back(index);

        const auto& children = variables_[index].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

// =============================================================================
// Structure
// =============================================================================

std::optional<size_t> VariableTree::indexOf(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Variable* VariableTree::find(std::string_view name) const {
    auto index = indexOf(name);
    return index ? &variables_[*index] : nullptr;
}

std::vector<std::string> VariableTree::flatten() const {
    std::vector<std::string> names;
    names.reserve(preorder_.size());
    for (size_t index : preorder_) {
        names.push_back(variables_[index].name);
    }
    return names;
}

// =============================================================================
// Rendering
// =============================================================================

std::string VariableTree::render() const {
    std::string out;

    // Depth of each variable, parents always precede children in pre-order
    std::vector<size_t> depth(variables_.size(), 0);
    for (size_t index : preorder_) {
        const auto& var = variables_[index];
        if (var.parent) {
            depth[index] = depth[*var.parent] + 1;
        }

        out += std::string(depth[index] * 4, ' ');
        if (var.parent) {
            out += fmt::format("[{} = {}] ", variables_[*var.parent].name, var.activation_value);
        }
        out += fmt::format("{}: {}\n", var.name, fmt::join(var.domain, ", "));
    }
    return out;
}

std::string VariableTree::declaration() const {
    std::vector<std::string> parts;
    parts.reserve(variables_.size());
    for (const auto& var : variables_) {
        if (var.parent) {
            parts.push_back(fmt::format("{}[{}={}]", var.name, variables_[*var.parent].name,
                                        var.activation_value));
        } else {
            parts.push_back(var.name);
        }
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

}  // namespace tuner
}  // namespace flamingo
