#include "recsyn/record/matchers.hpp"
#include "recsyn/record/patterns.hpp"

namespace recsyn::record {

using namespace il::match;

namespace {

// Reads the printed members of a PrintMembers body, one statement at a time.
class PrintMembersMatcher {
public:
    PrintMembersMatcher(const RecordContext& ctx, const il::NormalizedBody& body, il::VariablePtr builder, SymbolRef sym)
        : ctx_(ctx), body_(body), builder_(std::move(builder)), sym_(sym) {}

    bool run(){
        if(ctx_.inherited && !match_base_call()) return false;
        bool needs_comma = false;
        for(auto member : *ctx_.order){
            if(!printed(member)) continue;
            ctx_.token.throw_if_cancellation_requested();
            // callvirt Append(ldloc builder, ldstr "X")
            // callvirt Append(ldloc builder, ldstr " = ")
            // callvirt Append(ldloc builder, <value of X>)
            std::string text;
            if(!match_literal_run(text)) return reject("expected literal append");
            std::string expected = (needs_comma ? ", " : "") + ctx_.ts.member_name(member) + " = ";
            if(text != expected) return reject("literal text mismatch");
            if(!match_value(member)) return false;
            ++pos_;
            needs_comma = true;
        }
        // leave (ldc.i4 1)
        const il::Instruction* value = nullptr;
        if(!match_return(body_.at(pos_), value) || !match_ldc_i4_of(value, needs_comma ? 1 : 0))
            return reject("final return");
        if(pos_ + 1 != body_.size()) return reject("statements after the final return");
        return true;
    }

private:
    const RecordContext& ctx_;
    const il::NormalizedBody& body_;
    il::VariablePtr builder_;
    SymbolRef sym_;
    size_t pos_ = 0;

    bool reject(const char* reason) const { return ctx_.reject("print-members", sym_, reason); }

    bool printed(SymbolRef member) const {
        if(member.kind == SymbolKind::Method) return false;
        if(member.kind == SymbolKind::Field){
            const auto& f = ctx_.ts.field(member.id);
            return !f.is_static;
        }
        const auto& p = ctx_.ts.property(member.id);
        return !p.is_static && p.name != "EqualityContract" && !p.is_explicit_interface_impl;
    }

    // if (call PrintMembers(ldloc this, ldloc builder)) { callvirt Append(ldloc builder, ldstr ", ") }
    bool match_base_call(){
        const il::Instruction* cond = nullptr;
        const il::Instruction* then = nullptr;
        if(!match_if_instruction(body_.at(pos_), cond, then)) return reject("missing base PrintMembers call");
        auto* call = match_call_named(ctx_.ts, cond, "PrintMembers");
        if(!call || call->args.size() != 2) return reject("condition is not PrintMembers(this, builder)");
        if(!match_ld_this(call->args[0].get()) || !match_ld_loc_of(call->args[1].get(), builder_))
            return reject("condition is not PrintMembers(this, builder)");
        if(!match_append_literal(ctx_, unwrap_block(then), builder_, ", ")) return reject("base separator");
        ++pos_;
        return true;
    }

    // One or more consecutive Append(builder, ldstr) calls, concatenated.
    bool match_literal_run(std::string& text){
        bool any = false;
        for(;;){
            const il::Instruction* value = nullptr;
            std::string part;
            if(!match_string_builder_append(ctx_, body_.at(pos_), builder_, value) || !match_ld_str(value, part)) break;
            text += part;
            any = true;
            ++pos_;
        }
        return any;
    }

    // Append(builder, this.get_X()) or Append(builder, this.get_X().ToString()),
    // the latter possibly through addressof for value types.
    bool match_value(SymbolRef member){
        const il::Instruction* value = nullptr;
        if(!match_string_builder_append(ctx_, body_.at(pos_), builder_, value)) return reject("expected value append");
        if(auto* to_string = match_call_named(ctx_.ts, value, "ToString")){
            if(!ctx_.ts.method(to_string->method.def).is_static){
                if(to_string->args.size() != 1) return reject("ToString arity");
                value = to_string->args[0].get();
                if(auto* addr = il::as<il::AddressOf>(value)) value = addr->value.get();
            }
        }
        auto* getter_call = il::as_call_args(value);
        if(!getter_call || member.kind != SymbolKind::Property) return reject("value is not a getter call");
        if(getter_call->method.def != ctx_.ts.property(member.id).getter) return reject("wrong getter");
        if(getter_call->args.size() != 1 || !match_ld_this(getter_call->args[0].get())) return reject("getter not called on this");
        return true;
    }
};

} // namespace

bool is_generated_print_members(const RecordContext& ctx, MethodId method){
    const char* M = "print-members";
    SymbolRef sym{SymbolKind::Method, method};
    const auto& m = ctx.ts.method(method);
    if(m.name != "PrintMembers" || m.params.size() != 1) return ctx.reject(M, sym, "wrong signature");
    if(!m.is_overridable()) return ctx.reject(M, sym, "not overridable");
    if(!m.attributes.empty() || !m.return_attributes.empty()) return ctx.reject(M, sym, "has attributes");
    if(!ctx.order) return ctx.reject(M, sym, "member order unknown");
    auto body = ctx.decompile_body(method);
    if(!body) return ctx.reject(M, sym, "no body");
    auto builder = body->parameter(0);
    if(!builder || !ctx.ts.is_known(builder->type, KnownTypeCode::StringBuilder)) return ctx.reject(M, sym, "parameter is not a StringBuilder");
    return PrintMembersMatcher(ctx, *body, builder, sym).run();
}

} // namespace recsyn::record
