#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "recsyn/edn.hpp"
#include "recsyn/il/instructions.hpp"
#include "recsyn/loader.hpp"

namespace recsyn::loader_detail {

// Semantic error inside a method body; carries a diagnostic code and position.
struct body_error : std::runtime_error {
    body_error(std::string code, const std::string& msg, const edn::node* at)
        : std::runtime_error(msg), code(std::move(code)), line(at ? at->line : -1), col(at ? at->col : -1) {}
    std::string code;
    int line;
    int col;
};

// Resolves a type form with the type parameters of `scope` visible
// (invalid_id: none). Empty when a name does not resolve.
std::optional<TypeId> resolve_type(TypeSystem& ts, const edn::node_ptr& n, TypeDefId scope);

// Lowers a stored body to a fresh instruction tree. Throws body_error.
il::Function lower_body(TypeSystem& ts, MethodId method, const ModuleLoader::BodySource& src);

} // namespace recsyn::loader_detail
