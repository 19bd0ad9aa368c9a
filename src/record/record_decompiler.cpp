#include "recsyn/record/record_decompiler.hpp"

#include "recsyn/record/auto_properties.hpp"
#include "recsyn/record/matchers.hpp"

namespace recsyn::record {

RecordDecompiler::RecordDecompiler(const TypeSystem& ts, TypeDefId record, BodyDecompiler& decompiler,
                                   CancellationToken token, ClassifyEnv env)
    : ctx_{ts, record, decompiler, std::move(token), env, has_base_record(ts, record), {}, std::nullopt} {
    ctx_.backing_fields = detect_auto_properties(ctx_);
    ctx_.order = detect_member_order(ts, record, ctx_.backing_fields);
}

bool RecordDecompiler::method_is_generated(MethodId method) const {
    const auto& m = ctx_.ts.method(method);
    if(m.declaring != ctx_.def) return false;
    const std::string& name = m.name;
    // op_Equality/op_Inequality with (R, R) are emitted unconditionally; a user
    // may only add operators with other parameter types.
    if(name == "op_Equality" || name == "op_Inequality") return is_generated_comparison_operator(ctx_, method);
    if(name == "Equals" && m.params.size() == 1){
        TypeId param = m.params[0].type;
        if(ctx_.ts.is_known(param, KnownTypeCode::Object)) return true; // override bool Equals(object)
        if(ctx_.is_record_type(param)) return is_generated_equals(ctx_, method);
        return false;
    }
    // reserved name, cannot be declared in source
    if(name == "<Clone>$" && m.params.empty()) return true;
    if(name == "PrintMembers") return is_generated_print_members(ctx_, method);
    if(name == "ToString" && m.params.empty()) return is_generated_to_string(ctx_, method);
    if(name == "GetHashCode" && m.params.empty()) return is_generated_get_hash_code(ctx_, method);
    return false;
}

bool RecordDecompiler::property_is_generated(PropertyId property) const {
    const auto& p = ctx_.ts.property(property);
    if(p.declaring != ctx_.def) return false;
    if(p.name == "EqualityContract") return is_generated_equality_contract(ctx_, property);
    return false;
}

std::vector<MemberVerdict> RecordDecompiler::classify_all() const {
    std::vector<MemberVerdict> out;
    const auto& td = ctx_.type();
    for(auto p : td.properties)
        out.push_back(MemberVerdict{SymbolRef{SymbolKind::Property, p}, ctx_.ts.property(p).name, property_is_generated(p)});
    for(auto m : td.methods)
        out.push_back(MemberVerdict{SymbolRef{SymbolKind::Method, m}, ctx_.ts.method(m).name, method_is_generated(m)});
    return out;
}

bool is_generated_comparison_operator(const RecordContext& ctx, MethodId method){
    const auto& m = ctx.ts.method(method);
    if(m.params.size() != 2) return false;
    for(auto& p : m.params)
        if(!ctx.is_record_type(p.type)) return false;
    return true;
}

bool is_record_candidate(const TypeSystem& ts, TypeDefId def){
    return ts.find_method(def, "<Clone>$", 0).has_value();
}

} // namespace recsyn::record
