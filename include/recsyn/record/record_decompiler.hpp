// Classifies the members of one record type as compiler-generated or hand-written.
#pragma once
#include <string>
#include <vector>

#include "recsyn/record/context.hpp"

namespace recsyn::record {

struct MemberVerdict {
    SymbolRef member;
    std::string name;
    bool generated;
};

class RecordDecompiler {
public:
    // Detects automatic properties and the member order up front; throws
    // operation_canceled if `token` fires meanwhile.
    RecordDecompiler(const TypeSystem& ts, TypeDefId record, BodyDecompiler& decompiler, CancellationToken token,
                     ClassifyEnv env = detectEnv());

    // Whether the compiler emits this method for the record. Methods of other
    // types and names without a matcher are never generated. GetHashCode is
    // matched as well, unlike decompilers that only hide the members a record
    // declaration implies and always show GetHashCode.
    bool method_is_generated(MethodId method) const;
    bool property_is_generated(PropertyId property) const;

    const BackingFieldMap& backing_fields() const { return ctx_.backing_fields; }
    const MemberOrder& ordered_members() const { return ctx_.order; }
    bool is_inherited_record() const { return ctx_.inherited; }
    TypeDefId record() const { return ctx_.def; }

    // Properties first, then methods, each in declaration order.
    std::vector<MemberVerdict> classify_all() const;

private:
    RecordContext ctx_;
};

// Record types are the ones carrying the compiler-reserved clone method.
bool is_record_candidate(const TypeSystem& ts, TypeDefId def);

} // namespace recsyn::record
