#include "recsyn/record/patterns.hpp"

namespace recsyn::record {

using il::as;

const il::CallArgs* match_call_named(const TypeSystem& ts, const il::Instruction* inst, const char* name){
    const il::CallArgs* call = as<il::Call>(inst);
    if(!call) call = as<il::CallVirt>(inst);
    if(!call || call->method.def == invalid_id) return nullptr;
    return ts.method(call->method.def).name == name ? call : nullptr;
}

bool match_string_builder_append(const RecordContext& ctx, const il::Instruction* inst, const il::VariablePtr& sb,
                                 const il::Instruction*& value){
    auto* call = as<il::CallVirt>(inst);
    if(!call || call->method.def == invalid_id) return false;
    if(ctx.ts.method(call->method.def).name != "Append") return false;
    if(!ctx.ts.is_known(call->method.declaring_type, KnownTypeCode::StringBuilder)) return false;
    if(call->args.size() != 2) return false;
    if(!il::match::match_ld_loc_of(call->args[0].get(), sb)) return false;
    value = call->args[1].get();
    return true;
}

bool match_append_literal(const RecordContext& ctx, const il::Instruction* inst, const il::VariablePtr& sb, const char* text){
    const il::Instruction* value = nullptr;
    std::string s;
    return match_string_builder_append(ctx, inst, sb, value) && il::match::match_ld_str(value, s) && s == text;
}

bool match_ld_record_field(const RecordContext& ctx, const il::Instruction* inst, FieldId field, const il::Instruction*& target){
    FieldRef ref;
    const il::Instruction* t = nullptr;
    if(!il::match::match_ld_fld(inst, t, ref)) return false;
    if(ref.def != field || !ctx.is_record_type(ref.declaring_type)) return false;
    target = t;
    return true;
}

bool match_get_equality_contract(const RecordContext& ctx, const il::Instruction* inst, const il::Instruction*& target){
    auto* call = as<il::CallVirt>(inst);
    if(!call || call->method.def == invalid_id) return false;
    if(ctx.ts.method(call->method.def).name != "get_EqualityContract") return false;
    if(call->args.size() != 1) return false;
    target = call->args[0].get();
    return true;
}

bool is_equality_comparer_get_default_call(const TypeSystem& ts, const il::Instruction* inst, TypeId type){
    auto* call = as<il::Call>(inst);
    if(!call || call->method.def == invalid_id) return false;
    const auto& m = ts.method(call->method.def);
    if(m.name != "get_Default" || !m.is_static) return false;
    if(!ts.is_known(call->method.declaring_type, KnownTypeCode::EqualityComparerOf1)) return false;
    const auto& decl = ts.types().at(call->method.declaring_type);
    if(decl.kind != Type::Kind::Definition || decl.args.size() != 1) return false;
    if(!ts.erasure_equivalent(decl.args[0], type)) return false;
    return call->args.empty();
}

bool match_get_type_from_handle(const TypeSystem& ts, const il::Instruction* inst, TypeId& type){
    auto* call = as<il::Call>(inst);
    if(!call || call->method.def == invalid_id) return false;
    if(ts.method(call->method.def).name != "GetTypeFromHandle") return false;
    if(!ts.is_known(call->method.declaring_type, KnownTypeCode::Type)) return false;
    if(call->args.size() != 1) return false;
    auto* token = as<il::LdTypeToken>(call->args[0]);
    if(!token) return false;
    type = token->type;
    return true;
}

} // namespace recsyn::record
