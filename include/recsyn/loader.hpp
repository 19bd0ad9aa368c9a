// EDN module loader: builds the type system and serves method bodies.
#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "recsyn/body_decompiler.hpp"
#include "recsyn/edn.hpp"
#include "recsyn/type_system.hpp"

namespace recsyn {

struct LoadNote { std::string message; int line=-1; int col=-1; };
struct LoadError { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<LoadNote> notes; };
struct LoadWarning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<LoadNote> notes; };

struct LoadResult { bool success=true; std::vector<LoadError> errors; std::vector<LoadWarning> warnings; };

// Central reporter so every loading stage formats diagnostics the same way.
struct ErrorReporter {
    LoadResult* result=nullptr;
    void emit_error(LoadError e){ if(result){ result->success=false; result->errors.push_back(std::move(e)); } }
    void emit_warning(LoadWarning w){ if(result) result->warnings.push_back(std::move(w)); }
    void error(std::string code, std::string message, std::string hint, const edn::node* at){
        emit_error(LoadError{std::move(code), std::move(message), std::move(hint), at?at->line:-1, at?at->col:-1, {}});
    }
};

// Loads `(module ...)` forms into a
// TypeSystem. A corlib prelude with the known system types is loaded by the
// constructor. Method bodies are kept as EDN and lowered to instruction trees
// every time they are requested, so each decompile() call returns a fresh tree.
//
// Member references inside bodies:
//   field:  [DeclType name]                  (or a bare field name of the declaring type)
//   method: [DeclType name ParamType...]     parameter types are resolved in the
//                                            declaring definition's scope, so
//                                            [(inst EqualityComparer`1 int) Equals T T]
//   [DeclType name] without parameter types picks the only overload, or the
//   parameterless one when there are several.
class ModuleLoader : public BodyDecompiler {
public:
    explicit ModuleLoader(TypeSystem& ts);

    // Parses and loads one module. Parse errors become E1000 diagnostics.
    LoadResult load(std::string_view source);
    LoadResult load_form(const edn::node_ptr& module);

    std::optional<il::NormalizedBody> decompile(MethodId method, const CancellationToken& token) override;

    // Types declared by loaded modules, prelude excluded, in declaration order.
    const std::vector<TypeDefId>& loaded_types() const { return loaded_; }
    TypeSystem& type_system() { return ts_; }

    struct BodySource {
        edn::node_ptr body;   // vector of instructions or a (container ...) form
        edn::node_ptr locals; // [[name Type] ...] or null
    };

private:
    TypeSystem& ts_;
    std::unordered_map<MethodId, BodySource> bodies_;
    std::vector<TypeDefId> loaded_;
    bool loading_prelude_ = false;
};

// EDN text of the built-in corlib prelude.
const char* corlib_prelude();

} // namespace recsyn
