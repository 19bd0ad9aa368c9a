#include "recsyn/record/matchers.hpp"
#include "recsyn/record/patterns.hpp"

namespace recsyn::record {

using namespace il::match;

bool is_generated_to_string(const RecordContext& ctx, MethodId method){
    const char* M = "to-string";
    SymbolRef sym{SymbolKind::Method, method};
    const auto& m = ctx.ts.method(method);
    if(m.name != "ToString" || !m.params.empty()) return ctx.reject(M, sym, "wrong signature");
    if(!m.is_override) return ctx.reject(M, sym, "not an override");
    if(m.is_sealed) return ctx.reject(M, sym, "sealed");
    if(!m.attributes.empty() || !m.return_attributes.empty()) return ctx.reject(M, sym, "has attributes");
    auto body = ctx.decompile_body(method);
    if(!body) return ctx.reject(M, sym, "no body");

    // stloc sb(newobj StringBuilder..ctor())
    il::VariablePtr sb;
    const il::Instruction* init = nullptr;
    if(!match_st_loc(body->at(0), sb, init)) return ctx.reject(M, sym, "no builder local");
    auto* ctor = il::as<il::NewObj>(init);
    if(!ctor || !ctor->args.empty() || !ctx.ts.is_known(ctor->method.declaring_type, KnownTypeCode::StringBuilder))
        return ctx.reject(M, sym, "builder not created with new StringBuilder()");
    // Append(sb, "R"); Append(sb, " { ")
    if(!match_append_literal(ctx, body->at(1), sb, ctx.source_name().c_str())) return ctx.reject(M, sym, "record name literal");
    if(!match_append_literal(ctx, body->at(2), sb, " { ")) return ctx.reject(M, sym, "opening brace literal");

    size_t pos = 3;
    // if (callvirt PrintMembers(ldloc this, ldloc sb)) { Append(sb, " ") }
    // absent when the record prints nothing
    const il::Instruction* cond = nullptr;
    const il::Instruction* then = nullptr;
    if(match_if_instruction(body->at(pos), cond, then)){
        auto* call = il::as<il::CallVirt>(cond);
        if(!call || call->method.def == invalid_id || ctx.ts.method(call->method.def).name != "PrintMembers")
            return ctx.reject(M, sym, "condition is not PrintMembers");
        if(call->args.size() != 2 || !match_ld_this(call->args[0].get()) || !match_ld_loc_of(call->args[1].get(), sb))
            return ctx.reject(M, sym, "PrintMembers arguments");
        if(!match_append_literal(ctx, unwrap_block(then), sb, " ")) return ctx.reject(M, sym, "space literal");
        ++pos;
    }
    if(!match_append_literal(ctx, body->at(pos), sb, "}")) return ctx.reject(M, sym, "closing brace literal");
    // leave (callvirt ToString(ldloc sb))
    const il::Instruction* value = nullptr;
    if(!match_leave(body->at(pos + 1), value)) return ctx.reject(M, sym, "no leave");
    auto* call = il::as<il::CallVirt>(value);
    if(!call || call->method.def == invalid_id || ctx.ts.method(call->method.def).name != "ToString")
        return ctx.reject(M, sym, "result is not sb.ToString()");
    if(call->args.size() != 1 || !match_ld_loc_of(call->args[0].get(), sb)) return ctx.reject(M, sym, "result is not sb.ToString()");
    return true;
}

} // namespace recsyn::record
