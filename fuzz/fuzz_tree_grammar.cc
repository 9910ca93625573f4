// =============================================================================
// Flamingo - Variable Tree Grammar Fuzz Target
// =============================================================================

#include "flamingo/tuner/configuration_space.h"
#include "flamingo/tuner/variable_tree.h"

#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0)
        return 0;

    std::string declaration(reinterpret_cast<const char*>(data), size);

    auto decls = flamingo::tuner::VariableTree::parseDeclaration(declaration);
    if (!decls)
        return 0;

    // Give every declared variable a small domain so the tree validates
    flamingo::tuner::DomainMap domains;
    for (const auto& decl : *decls) {
        domains[decl.name] = {"0", "1"};
        if (decl.hasParent()) {
            domains[decl.parent].push_back(decl.activation_value);
        }
    }

    auto tree = flamingo::tuner::VariableTree::build(*decls, domains);
    if (!tree)
        return 0;

    // The canonical declaration must re-parse
    auto reparsed = flamingo::tuner::VariableTree::parse(tree->declaration(), domains);
    if (!reparsed)
        __builtin_trap();

    auto space = flamingo::tuner::ConfigurationSpace::create(std::move(*tree));
    if (!space || space->count() > 4096)
        return 0;

    uint64_t produced = 0;
    auto cursor = space->cursor();
    while (auto valuation = cursor.next()) {
        if (!space->contains(*valuation))
            __builtin_trap();
        ++produced;
    }
    if (produced != space->count())
        __builtin_trap();

    return 0;
}
