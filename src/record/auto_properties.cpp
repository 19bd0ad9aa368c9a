#include "recsyn/record/auto_properties.hpp"

#include "recsyn/il/match.hpp"

namespace recsyn::record {

using namespace il::match;

namespace {

// return this.field;  /  return Type.field;
bool is_auto_getter(const RecordContext& ctx, MethodId getter, FieldRef& field){
    auto body = ctx.decompile_body(getter);
    if(!body || body->size() != 1) return false;
    const il::Instruction* value = nullptr;
    if(!match_return(body->at(0), value)) return false;
    if(ctx.ts.method(getter).is_static) return match_lds_fld(value, field);
    const il::Instruction* target = nullptr;
    if(!match_ld_fld(value, target, field)) return false;
    return match_ld_this(target);
}

// this.field = value; return;
bool is_auto_setter(const RecordContext& ctx, MethodId setter, FieldRef& field){
    auto body = ctx.decompile_body(setter);
    if(!body || body->size() != 2) return false;
    const il::Instruction* value = nullptr;
    if(ctx.ts.method(setter).is_static){
        if(!match_sts_fld(body->at(0), field, value)) return false;
    } else {
        const il::Instruction* target = nullptr;
        if(!match_st_fld(body->at(0), target, field, value)) return false;
        if(!match_ld_this(target)) return false;
    }
    il::VariablePtr var;
    if(!match_ld_loc(value, var)) return false;
    if(!(var->kind == il::VariableKind::Parameter && var->index == 0)) return false;
    const il::Instruction* ret = nullptr;
    return match_return(body->at(1), ret) && match_nop(ret);
}

std::optional<FieldId> auto_property_field(const RecordContext& ctx, PropertyId id){
    const auto& p = ctx.ts.property(id);
    if(!p.params.empty()) return std::nullopt;
    std::optional<FieldRef> field;
    if(p.can_get()){
        FieldRef f;
        if(!is_auto_getter(ctx, p.getter, f)) return std::nullopt;
        field = f;
    }
    if(p.can_set()){
        FieldRef f;
        if(!is_auto_setter(ctx, p.setter, f)) return std::nullopt;
        if(field && *field != f) return std::nullopt;
        field = f;
    }
    if(!field) return std::nullopt;
    if(!ctx.is_record_type(field->declaring_type)) return std::nullopt;
    const auto& fd = ctx.ts.field(field->def);
    if(fd.declaring != ctx.def) return std::nullopt;
    if(fd.name != "<" + p.name + ">k__BackingField") return std::nullopt;
    return field->def;
}

} // namespace

BackingFieldMap detect_auto_properties(const RecordContext& ctx){
    BackingFieldMap map;
    for(auto id : ctx.type().properties){
        ctx.token.throw_if_cancellation_requested();
        if(auto field = auto_property_field(ctx, id)) map.add(id, *field);
    }
    return map;
}

MemberOrder detect_member_order(const TypeSystem& ts, TypeDefId def, const BackingFieldMap& fields){
    // Equals, GetHashCode and PrintMembers agree on one interleaving of fields
    // and properties; it is only recoverable when no field stands on its own.
    const auto& td = ts.definition(def);
    for(auto f : td.fields)
        if(!fields.has_field(f)) return std::nullopt;
    std::vector<SymbolRef> order;
    order.reserve(td.properties.size());
    for(auto p : td.properties) order.push_back(SymbolRef{SymbolKind::Property, p});
    return order;
}

} // namespace recsyn::record
