#include "loader_internal.hpp"

#include <limits>
#include <set>
#include <unordered_map>

namespace recsyn::loader_detail {

namespace {

std::optional<TypeId> resolve_named(TypeSystem& ts, const std::string& name, TypeDefId scope){
    if(name == "dynamic") return ts.types().get_dynamic();
    static const std::pair<const char*, KnownTypeCode> aliases[] = {
        {"object", KnownTypeCode::Object}, {"string", KnownTypeCode::String}, {"int", KnownTypeCode::Int32},
        {"bool", KnownTypeCode::Boolean}, {"void", KnownTypeCode::Void},
        {"CompilerGenerated", KnownTypeCode::CompilerGeneratedAttribute},
    };
    for(auto& a : aliases) if(name == a.first) return ts.known_type(a.second);
    if(scope != invalid_id){
        for(auto tp : ts.definition(scope).type_params)
            if(ts.types().at(tp).name == name) return tp;
    }
    auto def = ts.find_definition(name);
    if(!def) return std::nullopt;
    // a bare generic name denotes the open definition
    return ts.definition(*def).self_type;
}

} // namespace

std::optional<TypeId> resolve_type(TypeSystem& ts, const edn::node_ptr& n, TypeDefId scope){
    if(!n) return std::nullopt;
    if(edn::as_symbol(*n) || edn::as_string(*n)) return resolve_named(ts, edn::name_of(*n), scope);
    auto* l = edn::as_list(*n);
    if(!l || l->elems.size() < 2) return std::nullopt;
    std::string head = edn::head_name(*n);
    if(head == "?" || head == "ref"){
        if(l->elems.size() != 2) return std::nullopt;
        auto inner = resolve_type(ts, l->elems[1], scope);
        if(!inner) return std::nullopt;
        return head == "?" ? ts.types().get_nullable(*inner) : ts.types().get_byref(*inner);
    }
    if(head == "inst"){
        auto def = ts.find_definition(edn::name_of(*l->elems[1]));
        if(!def) return std::nullopt;
        std::vector<TypeId> args;
        for(size_t i = 2; i < l->elems.size(); ++i){
            auto a = resolve_type(ts, l->elems[i], scope);
            if(!a) return std::nullopt;
            args.push_back(*a);
        }
        if(args.size() != ts.definition(*def).type_params.size()) return std::nullopt;
        return ts.types().get_definition(*def, args);
    }
    return std::nullopt;
}

namespace {

using namespace il;

// Lowers the instruction forms of one method body.
class BodyReader {
public:
    BodyReader(TypeSystem& ts, MethodId method) : ts_(ts), method_(method), owner_(ts.method(method).declaring) {}

    Function run(const ModuleLoader::BodySource& src){
        Function fn;
        fn.method = method_;
        const auto& md = ts_.method(method_);
        if(!md.is_static)
            add_var(Variable{VariableKind::Parameter, -1, "this", ts_.definition(owner_).self_type});
        for(size_t i = 0; i < md.params.size(); ++i)
            add_var(Variable{VariableKind::Parameter, static_cast<int>(i), md.params[i].name, md.params[i].type});
        if(src.locals){
            auto* v = edn::as_vector(*src.locals);
            if(!v) throw body_error("E1300", ":locals must be a vector of [name Type]", src.locals.get());
            int index = 0;
            for(auto& e : v->elems){
                auto* pv = e ? edn::as_vector(*e) : nullptr;
                if(!pv || pv->elems.size() != 2) throw body_error("E1300", "local must be [name Type]", e.get());
                add_var(Variable{VariableKind::Local, index++, edn::name_of(*pv->elems[0]), type(pv->elems[1])});
            }
        }
        fn.variables = vars_;
        if(!src.body) throw body_error("E1300", "missing body", nullptr);
        if(auto* v = edn::as_vector(*src.body)){
            Block entry{"IL_0000", {}};
            for(auto& e : v->elems) entry.instructions.push_back(inst(e));
            fn.body = make(BlockContainer{{make(std::move(entry))}});
        } else if(edn::head_name(*src.body) == "container"){
            fn.body = inst(src.body);
        } else {
            throw body_error("E1300", "body must be a vector of instructions or a (container ...) form", src.body.get());
        }
        return fn;
    }

private:
    TypeSystem& ts_;
    MethodId method_;
    TypeDefId owner_;
    std::vector<VariablePtr> vars_;
    std::unordered_map<std::string, VariablePtr> by_name_;
    std::vector<std::pair<std::string, const edn::node*>> branches_;

    void add_var(Variable v){
        auto p = std::make_shared<const Variable>(std::move(v));
        by_name_[p->name] = p;
        vars_.push_back(p);
    }

    TypeId type(const edn::node_ptr& n, TypeDefId scope){
        auto t = resolve_type(ts_, n, scope);
        if(!t) throw body_error("E1100", "unknown type " + edn::to_string(n), n.get());
        return *t;
    }
    TypeId type(const edn::node_ptr& n){ return type(n, owner_); }

    VariablePtr variable(const edn::node_ptr& n){
        auto it = by_name_.find(edn::name_of(*n));
        if(it == by_name_.end()) throw body_error("E1301", "unknown variable " + edn::to_string(n), n.get());
        return it->second;
    }

    // [DeclType name] or a bare field name of the declaring type.
    FieldRef field(const edn::node_ptr& n){
        TypeId decl = ts_.definition(owner_).self_type;
        std::string name;
        if(auto* v = edn::as_vector(*n)){
            if(v->elems.size() != 2) throw body_error("E1300", "field reference must be [DeclType name]", n.get());
            decl = type(v->elems[0]);
            name = edn::name_of(*v->elems[1]);
        } else {
            name = edn::name_of(*n);
        }
        auto def = ts_.definition_of(decl);
        auto fid = def ? ts_.find_field(*def, name) : std::nullopt;
        if(!fid) throw body_error("E1200", "unknown field " + edn::to_string(n), n.get());
        return FieldRef{*fid, decl};
    }

    MethodRef method(const edn::node_ptr& n){
        auto* v = edn::as_vector(*n);
        if(!v || v->elems.size() < 2) throw body_error("E1300", "method reference must be [DeclType name ParamType...]", n.get());
        TypeId decl = type(v->elems[0]);
        auto def = ts_.definition_of(decl);
        if(!def) throw body_error("E1201", "method reference on a non-definition type " + edn::to_string(n), n.get());
        std::string name = edn::name_of(*v->elems[1]);
        std::vector<MethodId> candidates;
        for(auto mid : ts_.definition(*def).methods) if(ts_.method(mid).name == name) candidates.push_back(mid);

        if(v->elems.size() > 2){
            std::vector<TypeId> ptypes;
            for(size_t i = 2; i < v->elems.size(); ++i) ptypes.push_back(type(v->elems[i], *def));
            for(auto mid : candidates){
                const auto& ps = ts_.method(mid).params;
                if(ps.size() != ptypes.size()) continue;
                bool same = true;
                for(size_t i = 0; i < ps.size() && same; ++i) same = ts_.erasure_equivalent(ps[i].type, ptypes[i]);
                if(same) return MethodRef{mid, decl};
            }
            throw body_error("E1201", "no overload matches " + edn::to_string(n), n.get());
        }
        if(candidates.size() == 1) return MethodRef{candidates.front(), decl};
        for(auto mid : candidates) if(ts_.method(mid).params.empty()) return MethodRef{mid, decl};
        throw body_error("E1201", candidates.empty() ? "unknown method " + edn::to_string(n)
                                                     : "ambiguous method reference " + edn::to_string(n) + "; add parameter types",
                         n.get());
    }

    static void arity(const edn::node_ptr& n, const edn::form_view& f, size_t want){
        if(f.positional.size() != want)
            throw body_error("E1300", edn::head_name(*n) + " expects " + std::to_string(want) + " operand(s): " + edn::to_string(n), n.get());
    }

    void call_like(const edn::node_ptr& n, const edn::form_view& f, CallArgs& out){
        if(f.positional.empty()) throw body_error("E1300", "call without method reference: " + edn::to_string(n), n.get());
        out.method = method(f.positional[0]);
        for(size_t i = 1; i < f.positional.size(); ++i) out.args.push_back(inst(f.positional[i]));
        if(auto c = f.get("constrained")) out.constrained_to = type(c);
    }

    Block block(const edn::form_view& f, const std::string& default_label){
        Block b;
        b.label = f.has("label") ? edn::name_of(*f.get("label")) : default_label;
        for(auto& e : f.positional) b.instructions.push_back(inst(e));
        return b;
    }

    InstPtr container(const edn::node_ptr& n, const edn::form_view& f){
        if(f.positional.empty()) throw body_error("E1300", "empty container", n.get());
        auto saved = std::move(branches_);
        branches_.clear();
        BlockContainer c;
        std::set<std::string> labels;
        for(size_t i = 0; i < f.positional.size(); ++i){
            auto& e = f.positional[i];
            if(!e || edn::head_name(*e) != "block") throw body_error("E1300", "container may only hold (block ...) forms", e.get());
            auto bf = edn::split_form(*edn::as_list(*e));
            Block b = block(bf, i == 0 ? "IL_0000" : std::string{});
            if(b.label.empty()) throw body_error("E1300", "non-entry block needs :label", e.get());
            if(!labels.insert(b.label).second) throw body_error("E1300", "duplicate block label " + b.label, e.get());
            c.blocks.push_back(make(std::move(b)));
        }
        for(auto& br : branches_)
            if(!labels.count(br.first)) throw body_error("E1302", "unknown branch target " + br.first, br.second);
        branches_ = std::move(saved);
        return make(std::move(c));
    }

    InstPtr inst(const edn::node_ptr& n){
        if(!n) throw body_error("E1300", "missing instruction", nullptr);
        // operand-free opcodes may be written without parentheses
        if(auto* s = edn::as_symbol(*n)){
            if(s->name == "nop") return make(Nop{});
            if(s->name == "ldnull") return make(LdNull{});
            if(s->name == "ret" || s->name == "leave") return make(Leave{make(Nop{}), true});
            throw body_error("E1300", "unknown instruction " + s->name, n.get());
        }
        auto* l = edn::as_list(*n);
        std::string op = edn::head_name(*n);
        if(!l || op.empty()) throw body_error("E1300", "expected an instruction form, got " + edn::to_string(n), n.get());
        auto f = edn::split_form(*l);

        if(op == "nop"){ arity(n, f, 0); return make(Nop{}); }
        if(op == "ldnull"){ arity(n, f, 0); return make(LdNull{}); }
        if(op == "ldc.i4"){
            arity(n, f, 1);
            auto* v = edn::as_int(*f.positional[0]);
            if(!v || *v < std::numeric_limits<int32_t>::min() || *v > std::numeric_limits<int32_t>::max())
                throw body_error("E1300", "ldc.i4 expects a 32-bit integer", n.get());
            return make(LdcI4{static_cast<int32_t>(*v)});
        }
        if(op == "ldstr"){
            arity(n, f, 1);
            auto* v = edn::as_string(*f.positional[0]);
            if(!v) throw body_error("E1300", "ldstr expects a string literal", n.get());
            return make(LdStr{*v});
        }
        if(op == "ldtypetoken"){ arity(n, f, 1); return make(LdTypeToken{type(f.positional[0])}); }
        if(op == "ldloc"){ arity(n, f, 1); return make(LdLoc{variable(f.positional[0])}); }
        if(op == "stloc"){ arity(n, f, 2); return make(StLoc{variable(f.positional[0]), inst(f.positional[1])}); }
        if(op == "ldfld"){ arity(n, f, 2); return make(LdFld{inst(f.positional[1]), field(f.positional[0])}); }
        if(op == "stfld"){ arity(n, f, 3); return make(StFld{inst(f.positional[1]), field(f.positional[0]), inst(f.positional[2])}); }
        if(op == "ldsfld"){ arity(n, f, 1); return make(LdsFld{field(f.positional[0])}); }
        if(op == "stsfld"){ arity(n, f, 2); return make(StsFld{field(f.positional[0]), inst(f.positional[1])}); }
        if(op == "addressof"){
            arity(n, f, 1);
            InstPtr value = inst(f.positional[0]);
            TypeId t = f.has("type") ? type(f.get("type")) : invalid_id;
            return make(AddressOf{value, t});
        }
        if(op == "call"){ Call c; call_like(n, f, c); return make(std::move(c)); }
        if(op == "callvirt"){ CallVirt c; call_like(n, f, c); return make(std::move(c)); }
        if(op == "newobj"){ NewObj c; call_like(n, f, c); return make(std::move(c)); }
        if(op == "comp"){
            arity(n, f, 3);
            static const std::pair<const char*, ComparisonKind> kinds[] = {
                {"==", ComparisonKind::Equality}, {"!=", ComparisonKind::Inequality},
                {"<", ComparisonKind::LessThan}, {"<=", ComparisonKind::LessThanOrEqual},
                {">", ComparisonKind::GreaterThan}, {">=", ComparisonKind::GreaterThanOrEqual},
            };
            std::string k = edn::name_of(*f.positional[0]);
            for(auto& e : kinds)
                if(k == e.first) return make(Comp{e.second, inst(f.positional[1]), inst(f.positional[2])});
            throw body_error("E1300", "unknown comparison '" + k + "'", f.positional[0].get());
        }
        if(op == "logic.and"){ arity(n, f, 2); return make(LogicAnd{inst(f.positional[0]), inst(f.positional[1])}); }
        if(op == "binary"){
            arity(n, f, 3);
            std::string k = edn::name_of(*f.positional[0]);
            BinaryOp bop;
            if(k == "add") bop = BinaryOp::Add;
            else if(k == "sub") bop = BinaryOp::Sub;
            else if(k == "mul") bop = BinaryOp::Mul;
            else throw body_error("E1300", "unknown binary operator '" + k + "'", f.positional[0].get());
            bool ovf = false;
            if(auto o = f.get("ovf")){ if(auto* b = edn::as_bool(*o)) ovf = *b; }
            return make(BinaryNumeric{bop, ovf, inst(f.positional[1]), inst(f.positional[2])});
        }
        if(op == "if"){
            if(f.positional.size() != 2 && f.positional.size() != 3)
                throw body_error("E1300", "if expects a condition, a true branch and an optional false branch", n.get());
            InstPtr cond = inst(f.positional[0]);
            InstPtr t = inst(f.positional[1]);
            InstPtr e = f.positional.size() == 3 ? inst(f.positional[2]) : make(Nop{});
            return make(IfInstruction{cond, t, e});
        }
        if(op == "block") return make(block(f, "B"));
        if(op == "container") return container(n, f);
        if(op == "br"){
            arity(n, f, 1);
            std::string target = edn::name_of(*f.positional[0]);
            branches_.push_back({target, n.get()});
            return make(Branch{target});
        }
        if(op == "leave" || op == "ret"){
            if(f.positional.size() > 1) throw body_error("E1300", op + " takes at most one value", n.get());
            InstPtr value = f.positional.empty() ? make(Nop{}) : inst(f.positional[0]);
            return make(Leave{value, true});
        }
        throw body_error("E1300", "unknown instruction " + op, n.get());
    }
};

} // namespace

il::Function lower_body(TypeSystem& ts, MethodId method, const ModuleLoader::BodySource& src){
    BodyReader reader(ts, method);
    return reader.run(src);
}

} // namespace recsyn::loader_detail
