#include "recsyn/record/matchers.hpp"
#include "recsyn/record/patterns.hpp"

namespace recsyn::record {

bool is_generated_equality_contract(const RecordContext& ctx, PropertyId property){
    const char* M = "equality-contract";
    SymbolRef sym{SymbolKind::Property, property};
    const auto& p = ctx.ts.property(property);
    if(p.name != "EqualityContract") return ctx.reject(M, sym, "wrong name");
    if(p.access != Accessibility::Protected) return ctx.reject(M, sym, "not protected");
    if(!(ctx.ts.property_is_virtual(property) || ctx.ts.property_is_override(property))) return ctx.reject(M, sym, "not virtual");
    if(ctx.ts.property_is_sealed(property)) return ctx.reject(M, sym, "sealed");
    if(!(p.can_get() && !p.can_set())) return ctx.reject(M, sym, "not get-only");
    if(!p.attributes.empty()) return ctx.reject(M, sym, "property has attributes");
    const auto& getter = ctx.ts.method(p.getter);
    if(!getter.return_attributes.empty()) return ctx.reject(M, sym, "getter has return attributes");
    if(getter.attributes.size() != 1) return ctx.reject(M, sym, "getter attribute count");
    if(!ctx.ts.is_known(getter.attributes[0].type, KnownTypeCode::CompilerGeneratedAttribute))
        return ctx.reject(M, sym, "getter not [CompilerGenerated]");

    auto body = ctx.decompile_body(p.getter);
    if(!body || body->size() != 1) return ctx.reject(M, sym, "body is not one instruction");
    // leave (call GetTypeFromHandle(ldtypetoken R))
    auto* leave = il::as<il::Leave>(body->at(0));
    if(!leave) return ctx.reject(M, sym, "no leave");
    TypeId type = invalid_id;
    if(!match_get_type_from_handle(ctx.ts, leave->value.get(), type)) return ctx.reject(M, sym, "not typeof(...)");
    if(!ctx.is_record_type(type)) return ctx.reject(M, sym, "typeof names another type");
    return true;
}

} // namespace recsyn::record
