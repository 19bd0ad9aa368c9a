#include "recsyn/record/matchers.hpp"
#include "recsyn/record/patterns.hpp"

#include <algorithm>

namespace recsyn::record {

using namespace il::match;

namespace {

// Backing storage compared/hashed for a member, or nullopt when the member is
// left out (statics, EqualityContract, hand-written properties).
std::optional<FieldId> equality_field(const RecordContext& ctx, SymbolRef member){
    switch(member.kind){
        case SymbolKind::Field: {
            if(ctx.ts.field(member.id).is_static) return std::nullopt;
            return member.id;
        }
        case SymbolKind::Property: {
            const auto& p = ctx.ts.property(member.id);
            if(p.is_static || p.name == "EqualityContract") return std::nullopt;
            return ctx.backing_fields.field_of(member.id);
        }
        case SymbolKind::Method:
            return std::nullopt;
    }
    return std::nullopt;
}

// EqualityComparer<T>.Default.Method(ldfld f(target)...)
const il::CallArgs* match_comparer_call(const RecordContext& ctx, const il::Instruction* inst, const char* name,
                                        size_t arg_count, TypeId type){
    auto* call = il::as<il::CallVirt>(inst);
    if(!call || call->method.def == invalid_id || ctx.ts.method(call->method.def).name != name) return nullptr;
    if(call->args.size() != arg_count) return nullptr;
    if(!is_equality_comparer_get_default_call(ctx.ts, call->args[0].get(), type)) return nullptr;
    return call;
}

// Left-nested (h0 * -1521134295 + h1) * -1521134295 + h2 ... flattened to h0, h1, h2.
void unpack_hash_chain(const il::Instruction* inst, llvm::SmallVector<const il::Instruction*, 8>& out){
    const il::Instruction* sum_lhs = nullptr;
    const il::Instruction* sum_rhs = nullptr;
    const il::Instruction* factor_lhs = nullptr;
    const il::Instruction* factor_rhs = nullptr;
    if(match_binary(inst, il::BinaryOp::Add, sum_lhs, sum_rhs) && match_binary(sum_lhs, il::BinaryOp::Mul, factor_lhs, factor_rhs)
       && match_ldc_i4_of(factor_rhs, -1521134295)){
        unpack_hash_chain(factor_lhs, out);
        out.push_back(sum_rhs);
        return;
    }
    out.push_back(inst);
}

} // namespace

bool is_generated_equals(const RecordContext& ctx, MethodId method){
    const char* M = "equals";
    SymbolRef sym{SymbolKind::Method, method};
    const auto& m = ctx.ts.method(method);
    if(m.name != "Equals" || m.params.size() != 1 || !ctx.is_record_type(m.params[0].type))
        return ctx.reject(M, sym, "wrong signature");
    if(!m.is_overridable()) return ctx.reject(M, sym, "not overridable");
    if(!m.attributes.empty() || !m.return_attributes.empty()) return ctx.reject(M, sym, "has attributes");
    if(!ctx.order) return ctx.reject(M, sym, "member order unknown");
    // TODO: recognize the chain emitted for derived records (base.Equals(other) first).
    if(ctx.inherited) return ctx.reject(M, sym, "inherited record");
    auto body = ctx.decompile_body(method);
    if(!body) return ctx.reject(M, sym, "no body");
    const il::Instruction* value = nullptr;
    if(!match_return(body->at(0), value)) return ctx.reject(M, sym, "not a single return");
    auto other = body->parameter(0);
    if(!other) return ctx.reject(M, sym, "no parameter variable");

    auto conditions = unpack_logic_and_chain(value);
    size_t pos = 0;
    // comp(ldloc other != ldnull)
    const il::Instruction* arg = nullptr;
    if(pos >= conditions.size() || !match_comp_not_equals_null(conditions[pos], arg) || !match_ld_loc_of(arg, other))
        return ctx.reject(M, sym, "missing null check");
    ++pos;
    // call op_Equality(callvirt get_EqualityContract(ldloc this), callvirt get_EqualityContract(ldloc other))
    if(pos >= conditions.size()) return ctx.reject(M, sym, "missing EqualityContract comparison");
    auto* op = il::as<il::Call>(conditions[pos]);
    if(!op || op->method.def == invalid_id) return ctx.reject(M, sym, "missing EqualityContract comparison");
    const auto& op_def = ctx.ts.method(op->method.def);
    if(!op_def.is_operator || op_def.name != "op_Equality" || !ctx.ts.is_known(op->method.declaring_type, KnownTypeCode::Type))
        return ctx.reject(M, sym, "missing EqualityContract comparison");
    const il::Instruction* lhs = nullptr;
    const il::Instruction* rhs = nullptr;
    if(op->args.size() != 2 || !match_get_equality_contract(ctx, op->args[0].get(), lhs)
       || !match_get_equality_contract(ctx, op->args[1].get(), rhs))
        return ctx.reject(M, sym, "EqualityContract operands");
    if(!match_ld_this(lhs) || !match_ld_loc_of(rhs, other)) return ctx.reject(M, sym, "EqualityContract operands");
    ++pos;

    for(auto member : *ctx.order){
        auto field = equality_field(ctx, member);
        if(!field) continue;
        // callvirt Equals(call get_Default(), ldfld f(ldloc this), ldfld f(ldloc other))
        if(pos >= conditions.size()) return ctx.reject(M, sym, "chain too short");
        auto* call = match_comparer_call(ctx, conditions[pos], "Equals", 3, ctx.ts.field(*field).type);
        if(!call) return ctx.reject(M, sym, "member comparison");
        const il::Instruction* t1 = nullptr;
        const il::Instruction* t2 = nullptr;
        if(!match_ld_record_field(ctx, call->args[1].get(), *field, t1) || !match_ld_record_field(ctx, call->args[2].get(), *field, t2))
            return ctx.reject(M, sym, "member comparison operands");
        if(!match_ld_this(t1) || !match_ld_loc_of(t2, other)) return ctx.reject(M, sym, "member comparison operands");
        ++pos;
    }
    if(pos != conditions.size()) return ctx.reject(M, sym, "chain has extra conditions");
    return true;
}

bool is_generated_get_hash_code(const RecordContext& ctx, MethodId method){
    const char* M = "get-hash-code";
    SymbolRef sym{SymbolKind::Method, method};
    const auto& m = ctx.ts.method(method);
    if(m.name != "GetHashCode" || !m.params.empty()) return ctx.reject(M, sym, "wrong signature");
    if(!m.is_override) return ctx.reject(M, sym, "not an override");
    if(m.is_sealed) return ctx.reject(M, sym, "sealed");
    if(!m.attributes.empty() || !m.return_attributes.empty()) return ctx.reject(M, sym, "has attributes");
    if(!ctx.order) return ctx.reject(M, sym, "member order unknown");
    auto body = ctx.decompile_body(method);
    if(!body) return ctx.reject(M, sym, "no body");
    const il::Instruction* value = nullptr;
    if(!match_return(body->at(0), value)) return ctx.reject(M, sym, "not a single return");

    llvm::SmallVector<const il::Instruction*, 8> hashes;
    unpack_hash_chain(value, hashes);
    size_t pos = 0;
    if(ctx.inherited){
        // call GetHashCode(ldloc this) on the base record
        auto* call = il::as<il::Call>(hashes[pos]);
        if(!call || call->method.def == invalid_id || ctx.ts.method(call->method.def).name != "GetHashCode")
            return ctx.reject(M, sym, "missing base.GetHashCode()");
        const auto& bases = ctx.type().direct_base_types;
        if(std::find(bases.begin(), bases.end(), call->method.declaring_type) == bases.end())
            return ctx.reject(M, sym, "base call on another type");
        if(call->args.size() != 1 || !match_ld_this(call->args[0].get())) return ctx.reject(M, sym, "missing base.GetHashCode()");
    } else {
        // callvirt GetHashCode(call EqualityComparer<Type>.get_Default(), callvirt get_EqualityContract(ldloc this))
        auto type = ctx.ts.known_type(KnownTypeCode::Type);
        auto* call = type ? match_comparer_call(ctx, hashes[pos], "GetHashCode", 2, *type) : nullptr;
        const il::Instruction* target = nullptr;
        if(!call || !match_get_equality_contract(ctx, call->args[1].get(), target) || !match_ld_this(target))
            return ctx.reject(M, sym, "missing EqualityContract hash");
    }
    ++pos;
    for(auto member : *ctx.order){
        auto field = equality_field(ctx, member);
        if(!field) continue;
        // callvirt GetHashCode(call get_Default(), ldfld f(ldloc this))
        if(pos >= hashes.size()) return ctx.reject(M, sym, "chain too short");
        auto* call = match_comparer_call(ctx, hashes[pos], "GetHashCode", 2, ctx.ts.field(*field).type);
        const il::Instruction* target = nullptr;
        if(!call || !match_ld_record_field(ctx, call->args[1].get(), *field, target) || !match_ld_this(target))
            return ctx.reject(M, sym, "member hash");
        ++pos;
    }
    if(pos != hashes.size()) return ctx.reject(M, sym, "chain has extra terms");
    return true;
}

} // namespace recsyn::record
