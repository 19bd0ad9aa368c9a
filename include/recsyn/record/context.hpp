// Per-record analysis state shared by the detectors and matchers.
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "recsyn/body_decompiler.hpp"
#include "recsyn/env.hpp"
#include "recsyn/type_system.hpp"

namespace recsyn::record {

// Property <-> backing field, one table with a lookup view for each side.
// Only automatic properties are recorded; immutable once the detector returns.
class BackingFieldMap {
public:
    // Both sides must be new to the table.
    bool add(PropertyId property, FieldId field);

    std::optional<FieldId> field_of(PropertyId property) const;
    std::optional<PropertyId> property_of(FieldId field) const;
    bool has_field(FieldId field) const { return property_of(field).has_value(); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<std::pair<PropertyId, FieldId>>& entries() const { return entries_; }

private:
    std::vector<std::pair<PropertyId, FieldId>> entries_;
};

// Canonical member order; std::nullopt means "unknown", which is not the same as empty.
using MemberOrder = std::optional<std::vector<SymbolRef>>;

struct RecordContext {
    const TypeSystem& ts;
    TypeDefId def;
    BodyDecompiler& decompiler;
    CancellationToken token;
    ClassifyEnv env;
    bool inherited = false;
    BackingFieldMap backing_fields;
    MemberOrder order;

    const TypeDefinition& type() const { return ts.definition(def); }

    // Same definition with type arguments equal to the record's own type
    // parameters, looking through nullable annotations.
    bool is_record_type(TypeId type) const;

    // Record name as written in source: generic arity suffix removed.
    std::string source_name() const;

    // Normalized body of `method`, dumped to llvm::errs() when RECSYN_DUMP_BODIES is set.
    std::optional<il::NormalizedBody> decompile_body(MethodId method) const;

    std::string member_label(SymbolRef member) const;

    // Traces the rejection (RECSYN_TRACE) and returns false.
    bool reject(const char* matcher, SymbolRef member, const char* reason) const;
};

// Record is inherited when a direct base is a class other than System.Object.
bool has_base_record(const TypeSystem& ts, TypeDefId def);

} // namespace recsyn::record
