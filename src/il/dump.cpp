#include "recsyn/il/dump.hpp"
#include <type_traits>

namespace recsyn::il {

const char* opcode_name(const Instruction& inst){
    struct V {
        const char* operator()(const Nop&) const { return "nop"; }
        const char* operator()(const LdcI4&) const { return "ldc.i4"; }
        const char* operator()(const LdStr&) const { return "ldstr"; }
        const char* operator()(const LdNull&) const { return "ldnull"; }
        const char* operator()(const LdTypeToken&) const { return "ldtypetoken"; }
        const char* operator()(const LdLoc&) const { return "ldloc"; }
        const char* operator()(const StLoc&) const { return "stloc"; }
        const char* operator()(const LdFld&) const { return "ldfld"; }
        const char* operator()(const StFld&) const { return "stfld"; }
        const char* operator()(const LdsFld&) const { return "ldsfld"; }
        const char* operator()(const StsFld&) const { return "stsfld"; }
        const char* operator()(const AddressOf&) const { return "addressof"; }
        const char* operator()(const Call&) const { return "call"; }
        const char* operator()(const CallVirt&) const { return "callvirt"; }
        const char* operator()(const NewObj&) const { return "newobj"; }
        const char* operator()(const Comp&) const { return "comp"; }
        const char* operator()(const LogicAnd&) const { return "logic.and"; }
        const char* operator()(const BinaryNumeric&) const { return "binary"; }
        const char* operator()(const IfInstruction&) const { return "if"; }
        const char* operator()(const Block&) const { return "Block"; }
        const char* operator()(const BlockContainer&) const { return "BlockContainer"; }
        const char* operator()(const Branch&) const { return "br"; }
        const char* operator()(const Leave&) const { return "leave"; }
    };
    return std::visit(V{}, inst.data);
}

namespace {

const char* comparison_text(ComparisonKind k){
    switch(k){
        case ComparisonKind::Equality: return "==";
        case ComparisonKind::Inequality: return "!=";
        case ComparisonKind::LessThan: return "<";
        case ComparisonKind::LessThanOrEqual: return "<=";
        case ComparisonKind::GreaterThan: return ">";
        case ComparisonKind::GreaterThanOrEqual: return ">=";
    }
    return "?";
}

const char* binary_text(BinaryOp op){
    switch(op){
        case BinaryOp::Add: return "add";
        case BinaryOp::Sub: return "sub";
        case BinaryOp::Mul: return "mul";
    }
    return "?";
}

void write_string_literal(llvm::raw_ostream& os, const std::string& s){
    os << '"';
    for(char c : s){
        switch(c){
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\t': os << "\\t"; break;
            default: os << c; break;
        }
    }
    os << '"';
}

struct Printer {
    llvm::raw_ostream& os;
    const TypeSystem& ts;

    void field(const FieldRef& f){ os << (f.def == invalid_id ? std::string("<field?>") : ts.field(f.def).name); }
    void method(const MethodRef& m){
        if(m.def == invalid_id){ os << "<method?>"; return; }
        const auto& md = ts.method(m.def);
        if(md.name == ".ctor") os << ts.type_name(m.declaring_type) << "..ctor";
        else os << md.name;
    }
    void args(const std::vector<InstPtr>& as){
        os << '(';
        for(size_t i = 0; i < as.size(); ++i){ if(i) os << ", "; expr(as[i].get()); }
        os << ')';
    }
    void pad(unsigned indent){ os.indent(indent * 2); }

    // Statement-level printing; nested blocks get their own lines.
    void stmt(const Instruction* inst, unsigned indent){
        pad(indent);
        if(auto* b = as<Block>(inst)){ block(*b, indent); return; }
        if(auto* c = as<BlockContainer>(inst)){ container(*c, indent); return; }
        if(auto* ifi = as<IfInstruction>(inst)){
            os << "if ("; expr(ifi->condition.get()); os << ") ";
            branch_body(ifi->true_inst.get(), indent);
            if(ifi->false_inst && !as<Nop>(ifi->false_inst)){ pad(indent); os << "else "; branch_body(ifi->false_inst.get(), indent); }
            return;
        }
        expr(inst);
        os << '\n';
    }
    void branch_body(const Instruction* inst, unsigned indent){
        if(auto* b = as<Block>(inst)){ block(*b, indent); return; }
        os << "{\n"; stmt(inst, indent + 1); pad(indent); os << "}\n";
    }
    void block(const Block& b, unsigned indent){
        os << "Block " << (b.label.empty() ? std::string("-") : b.label) << " {\n";
        for(auto& i : b.instructions) stmt(i.get(), indent + 1);
        pad(indent); os << "}\n";
    }
    void container(const BlockContainer& c, unsigned indent){
        os << "BlockContainer {\n";
        for(auto& b : c.blocks) stmt(b.get(), indent + 1);
        pad(indent); os << "}\n";
    }

    void expr(const Instruction* inst){
        if(!inst){ os << "<null>"; return; }
        std::visit([&](auto&& n){
            using T = std::decay_t<decltype(n)>;
            os << opcode_name(*inst);
            if constexpr(std::is_same_v<T, Nop> || std::is_same_v<T, LdNull>){}
            else if constexpr(std::is_same_v<T, LdcI4>){ os << ' ' << n.value; }
            else if constexpr(std::is_same_v<T, LdStr>){ os << ' '; write_string_literal(os, n.value); }
            else if constexpr(std::is_same_v<T, LdTypeToken>){ os << ' ' << ts.type_name(n.type); }
            else if constexpr(std::is_same_v<T, LdLoc>){ os << ' ' << (n.var ? n.var->name : std::string("?")); }
            else if constexpr(std::is_same_v<T, StLoc>){ os << ' ' << (n.var ? n.var->name : std::string("?")) << '('; expr(n.value.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, LdFld>){ os << ' '; field(n.field); os << '('; expr(n.target.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, StFld>){ os << ' '; field(n.field); os << '('; expr(n.target.get()); os << ", "; expr(n.value.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, LdsFld>){ os << ' '; field(n.field); }
            else if constexpr(std::is_same_v<T, StsFld>){ os << ' '; field(n.field); os << '('; expr(n.value.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, AddressOf>){ os << ' ' << ts.type_name(n.type) << '('; expr(n.value.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, Call> || std::is_same_v<T, CallVirt> || std::is_same_v<T, NewObj>){
                os << ' ';
                if(n.constrained_to != invalid_id) os << "constrained[" << ts.type_name(n.constrained_to) << "] ";
                method(n.method); args(n.args);
            }
            else if constexpr(std::is_same_v<T, Comp>){ os << '('; expr(n.lhs.get()); os << ' ' << comparison_text(n.kind) << ' '; expr(n.rhs.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, LogicAnd>){ os << '('; expr(n.lhs.get()); os << ", "; expr(n.rhs.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, BinaryNumeric>){ os << '.' << binary_text(n.op) << (n.check_overflow ? ".ovf" : "") << '('; expr(n.lhs.get()); os << ", "; expr(n.rhs.get()); os << ')'; }
            else if constexpr(std::is_same_v<T, IfInstruction>){ os << " ("; expr(n.condition.get()); os << ") "; expr(n.true_inst.get()); if(n.false_inst && !as<Nop>(n.false_inst)){ os << " else "; expr(n.false_inst.get()); } }
            else if constexpr(std::is_same_v<T, Block>){ os << ' ' << (n.label.empty() ? std::string("-") : n.label) << " { "; for(auto& i : n.instructions){ expr(i.get()); os << "; "; } os << '}'; }
            else if constexpr(std::is_same_v<T, BlockContainer>){ os << " { "; for(auto& b : n.blocks){ expr(b.get()); os << ' '; } os << '}'; }
            else if constexpr(std::is_same_v<T, Branch>){ os << ' ' << n.target; }
            else if constexpr(std::is_same_v<T, Leave>){ os << " ("; expr(n.value.get()); os << ')'; }
        }, inst->data);
    }
};

} // namespace

void dump(llvm::raw_ostream& os, const TypeSystem& ts, const Instruction& inst, unsigned indent){
    Printer{os, ts}.stmt(&inst, indent);
}

void dump(llvm::raw_ostream& os, const TypeSystem& ts, const NormalizedBody& body){
    if(!body.entry){ os << "<no body>\n"; return; }
    Printer p{os, ts};
    p.block(*body.entry, 0);
}

std::string to_string(const TypeSystem& ts, const Instruction& inst){
    std::string s;
    llvm::raw_string_ostream os(s);
    Printer{os, ts}.expr(&inst);
    os.flush();
    return s;
}

} // namespace recsyn::il
