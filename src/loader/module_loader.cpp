#include "loader_internal.hpp"

#include <stdexcept>

#include <llvm/Support/raw_ostream.h>

#include "recsyn/il/normalize.hpp"
#include "recsyn/record/record_decompiler.hpp"

namespace recsyn {

using namespace loader_detail;

namespace {

bool kw_bool(const edn::form_view& f, const char* key, bool def = false){
    auto n = f.get(key);
    if(!n) return def;
    if(auto* b = edn::as_bool(*n)) return *b;
    return def;
}

std::string kw_name(const edn::form_view& f, const char* key){
    auto n = f.get(key);
    return n ? edn::name_of(*n) : std::string{};
}

std::optional<Accessibility> parse_access(const std::string& s){
    if(s == "public") return Accessibility::Public;
    if(s == "private") return Accessibility::Private;
    if(s == "protected") return Accessibility::Protected;
    if(s == "internal") return Accessibility::Internal;
    if(s == "protected-internal") return Accessibility::ProtectedOrInternal;
    if(s == "private-protected") return Accessibility::ProtectedAndInternal;
    return std::nullopt;
}

std::optional<KnownTypeCode> parse_known(const std::string& s){
    static const std::pair<const char*, KnownTypeCode> table[] = {
        {"Object", KnownTypeCode::Object}, {"Void", KnownTypeCode::Void}, {"Boolean", KnownTypeCode::Boolean},
        {"Int32", KnownTypeCode::Int32}, {"String", KnownTypeCode::String}, {"Type", KnownTypeCode::Type},
        {"RuntimeTypeHandle", KnownTypeCode::RuntimeTypeHandle}, {"ValueType", KnownTypeCode::ValueType},
        {"StringBuilder", KnownTypeCode::StringBuilder}, {"EqualityComparerOf1", KnownTypeCode::EqualityComparerOf1},
        {"IEquatableOf1", KnownTypeCode::IEquatableOf1}, {"CompilerGeneratedAttribute", KnownTypeCode::CompilerGeneratedAttribute},
    };
    for(auto& e : table) if(s == e.first) return e.second;
    return std::nullopt;
}

struct PendingType { TypeDefId id; const edn::list* form; const edn::node* at; };

class DeclLoader {
public:
    DeclLoader(TypeSystem& ts, ErrorReporter rep, std::unordered_map<MethodId, ModuleLoader::BodySource>& bodies, bool prelude)
        : ts_(ts), rep_(rep), bodies_(bodies), prelude_(prelude) {}

    std::vector<TypeDefId> run(const edn::node_ptr& module){
        std::vector<TypeDefId> declared;
        auto* l = edn::as_list(*module);
        if(!l || edn::head_name(*module) != "module"){
            rep_.error("E1001", "expected (module ...) form", "wrap type declarations in (module :id \"name\" ...)", module.get());
            return declared;
        }
        auto f = edn::split_form(*l);
        std::vector<PendingType> pending;
        for(auto& p : f.positional){
            if(!p || edn::head_name(*p) != "type"){
                rep_.error("E1001", "unexpected form in module: " + (p ? edn::to_string(p) : std::string("<null>")), "only (type ...) forms are allowed at module level", p.get());
                continue;
            }
            if(auto id = declare_type(*p)){ pending.push_back({*id, edn::as_list(*p), p.get()}); declared.push_back(*id); }
        }
        // members reference arbitrary types, so all headers exist before any member is read
        for(auto& pt : pending) load_members(pt);
        return declared;
    }

private:
    TypeSystem& ts_;
    ErrorReporter rep_;
    std::unordered_map<MethodId, ModuleLoader::BodySource>& bodies_;
    bool prelude_;

    std::optional<TypeDefId> declare_type(const edn::node& n){
        auto f = edn::split_form(*edn::as_list(n));
        TypeDefinition def;
        def.name = kw_name(f, "name");
        def.ns = kw_name(f, "ns");
        if(def.name.empty()){ rep_.error("E1001", "type without :name", "add :name \"TypeName\"", &n); return std::nullopt; }
        if(ts_.find_definition(def.full_name())){
            rep_.error("E1101", "duplicate type " + def.full_name(), "type names must be unique across loaded modules", &n);
            return std::nullopt;
        }
        std::string kind = kw_name(f, "kind");
        if(kind == "struct") def.kind = TypeKind::Struct;
        else if(kind == "interface") def.kind = TypeKind::Interface;
        else if(!kind.empty() && kind != "class"){ rep_.error("E1001", "unknown type kind '" + kind + "'", "use class, struct or interface", &n); }
        if(prelude_){
            if(auto k = f.get("known")){
                if(auto code = parse_known(edn::name_of(*k))) def.known = *code;
            }
        }
        TypeDefId id = ts_.add_definition(std::move(def));
        std::vector<TypeId> tps;
        if(auto tp = f.get("type-params")){
            if(auto* v = edn::as_vector(*tp)){
                uint32_t i = 0;
                for(auto& e : v->elems) tps.push_back(ts_.types().get_type_parameter(id, i++, edn::name_of(*e)));
            }
        }
        auto& d = ts_.definition(id);
        d.type_params = tps;
        d.self_type = ts_.types().get_definition(id, tps);
        return id;
    }

    std::optional<TypeId> type_or_error(const edn::node_ptr& n, TypeDefId scope){
        if(!n) return std::nullopt;
        auto t = resolve_type(ts_, n, scope);
        if(!t) rep_.error("E1100", "unknown type " + edn::to_string(n), "declare the type in a (type ...) form or use a corlib name", n.get());
        return t;
    }

    std::vector<Attribute> attributes(const edn::node_ptr& n, TypeDefId scope){
        std::vector<Attribute> out;
        if(!n) return out;
        auto* v = edn::as_vector(*n);
        if(!v){ rep_.error("E1001", ":attrs must be a vector", "write :attrs [CompilerGenerated]", n.get()); return out; }
        for(auto& e : v->elems) if(auto t = type_or_error(e, scope)) out.push_back(Attribute{*t});
        return out;
    }

    std::vector<Parameter> parameters(const edn::node_ptr& n, TypeDefId scope){
        std::vector<Parameter> out;
        if(!n) return out;
        auto* v = edn::as_vector(*n);
        if(!v){ rep_.error("E1001", ":params must be a vector", "write :params [[name Type] ...]", n.get()); return out; }
        for(auto& e : v->elems){
            auto* pv = e ? edn::as_vector(*e) : nullptr;
            if(!pv || pv->elems.size() != 2){ rep_.error("E1001", "parameter must be [name Type]", "", e.get()); continue; }
            auto t = type_or_error(pv->elems[1], scope);
            out.push_back(Parameter{edn::name_of(*pv->elems[0]), t ? *t : invalid_id});
        }
        return out;
    }

    Accessibility access(const edn::form_view& f, const edn::node* at, Accessibility def){
        auto n = f.get("access");
        if(!n) return def;
        auto a = parse_access(edn::name_of(*n));
        if(!a){ rep_.error("E1001", "unknown accessibility " + edn::to_string(n), "use public, private, protected, internal, protected-internal or private-protected", at); return def; }
        return *a;
    }

    void load_members(const PendingType& pt){
        auto f = edn::split_form(*pt.form);
        if(auto bases = f.get("base")){
            if(auto* v = edn::as_vector(*bases)){
                for(auto& b : v->elems) if(auto t = type_or_error(b, pt.id)) ts_.definition(pt.id).direct_base_types.push_back(*t);
            }
        }
        ts_.definition(pt.id).attributes = attributes(f.get("attrs"), pt.id);

        // fields and methods first so properties can name accessors declared after them
        std::vector<edn::node_ptr> props;
        for(auto& m : f.positional){
            std::string head = m ? edn::head_name(*m) : std::string{};
            if(head == "field") load_field(pt.id, *m);
            else if(head == "method") load_method(pt.id, *m);
            else if(head == "property") props.push_back(m);
            else rep_.error("E1001", "unexpected member form " + (m ? edn::to_string(m) : std::string("<null>")), "members are (field ...), (method ...) or (property ...)", m.get());
        }
        for(auto& p : props) load_property(pt.id, *p);
    }

    void load_field(TypeDefId owner, const edn::node& n){
        auto f = edn::split_form(*edn::as_list(n));
        FieldDef fd;
        fd.name = kw_name(f, "name");
        if(fd.name.empty()){ rep_.error("E1001", "field without :name", "", &n); return; }
        auto t = type_or_error(f.get("type"), owner);
        if(!f.has("type")) rep_.error("E1001", "field " + fd.name + " without :type", "", &n);
        fd.type = t ? *t : invalid_id;
        fd.access = access(f, &n, Accessibility::Private);
        fd.is_static = kw_bool(f, "static");
        fd.is_readonly = kw_bool(f, "readonly");
        fd.attributes = attributes(f.get("attrs"), owner);
        ts_.add_field(owner, std::move(fd));
    }

    void load_method(TypeDefId owner, const edn::node& n){
        auto f = edn::split_form(*edn::as_list(n));
        MethodDef md;
        md.name = kw_name(f, "name");
        if(md.name.empty()){ rep_.error("E1001", "method without :name", "", &n); return; }
        if(auto r = f.get("ret")){ auto t = type_or_error(r, owner); md.ret = t ? *t : invalid_id; }
        else if(auto v = ts_.known_type(KnownTypeCode::Void)) md.ret = *v;
        md.params = parameters(f.get("params"), owner);
        md.access = access(f, &n, Accessibility::Private);
        md.is_static = kw_bool(f, "static");
        md.is_virtual = kw_bool(f, "virtual");
        md.is_override = kw_bool(f, "override");
        md.is_sealed = kw_bool(f, "sealed");
        md.is_abstract = kw_bool(f, "abstract");
        md.is_operator = kw_bool(f, "operator", md.name.rfind("op_", 0) == 0);
        md.is_explicit_interface_impl = kw_bool(f, "explicit-impl");
        md.attributes = attributes(f.get("attrs"), owner);
        md.return_attributes = attributes(f.get("ret-attrs"), owner);
        auto body = f.get("body");
        md.has_body = body != nullptr;
        MethodId id = ts_.add_method(owner, std::move(md));
        if(body) bodies_[id] = ModuleLoader::BodySource{body, f.get("locals")};
    }

    void load_property(TypeDefId owner, const edn::node& n){
        auto f = edn::split_form(*edn::as_list(n));
        PropertyDef pd;
        pd.name = kw_name(f, "name");
        if(pd.name.empty()){ rep_.error("E1001", "property without :name", "", &n); return; }
        auto t = type_or_error(f.get("type"), owner);
        pd.type = t ? *t : invalid_id;
        pd.access = access(f, &n, Accessibility::Public);
        pd.is_static = kw_bool(f, "static");
        pd.is_explicit_interface_impl = kw_bool(f, "explicit-impl");
        pd.attributes = attributes(f.get("attrs"), owner);
        pd.params = parameters(f.get("params"), owner);
        auto accessor = [&](const char* key) -> MethodId {
            std::string name = kw_name(f, key);
            if(name.empty()) return invalid_id;
            auto m = ts_.find_method(owner, name);
            if(!m){ rep_.error("E1202", "unknown accessor method '" + name + "' for property " + pd.name, "declare the accessor as a (method ...) of the same type", f.get(key).get()); return invalid_id; }
            return *m;
        };
        pd.getter = accessor("get");
        pd.setter = accessor("set");
        ts_.add_property(owner, std::move(pd));
    }
};

} // namespace

ModuleLoader::ModuleLoader(TypeSystem& ts) : ts_(ts) {
    loading_prelude_ = true;
    auto r = load(corlib_prelude());
    loading_prelude_ = false;
    loaded_.clear();
    if(!r.success){
        std::string msg = "corlib prelude failed to load";
        if(!r.errors.empty()) msg += ": " + r.errors.front().message;
        throw std::logic_error(msg);
    }
}

LoadResult ModuleLoader::load(std::string_view source){
    edn::node_ptr form;
    try {
        form = edn::parse(source);
    } catch(const edn::parse_error& e){
        LoadResult r; ErrorReporter rep{&r};
        rep.emit_error(LoadError{"E1000", e.what(), "check parentheses and string quoting", e.line, e.col, {}});
        return r;
    }
    return load_form(form);
}

LoadResult ModuleLoader::load_form(const edn::node_ptr& module){
    LoadResult r;
    ErrorReporter rep{&r};
    DeclLoader decls(ts_, rep, bodies_, loading_prelude_);
    auto declared = decls.run(module);
    // Validate every body now so malformed input is reported at load time
    // instead of turning into a silent "not generated" later.
    for(auto id : declared){
        for(auto mid : ts_.definition(id).methods){
            auto it = bodies_.find(mid);
            if(it == bodies_.end()){
                const auto& md = ts_.method(mid);
                if(!loading_prelude_ && !md.is_abstract && record::is_record_candidate(ts_, id))
                    rep.emit_warning(LoadWarning{"W1400", "method " + ts_.definition(id).name + "::" + md.name + " has no body",
                                                 "it will be classified as not generated", -1, -1, {}});
                continue;
            }
            try {
                (void)lower_body(ts_, mid, it->second);
            } catch(const body_error& e){
                LoadError err{e.code, e.what(), "", e.line, e.col, {}};
                err.notes.push_back(LoadNote{"in method " + ts_.definition(id).name + "::" + ts_.method(mid).name, -1, -1});
                rep.emit_error(std::move(err));
            }
        }
        loaded_.push_back(id);
    }
    return r;
}

std::optional<il::NormalizedBody> ModuleLoader::decompile(MethodId method, const CancellationToken& token){
    token.throw_if_cancellation_requested();
    auto it = bodies_.find(method);
    if(it == bodies_.end()) return std::nullopt;
    try {
        return il::normalize_function(lower_body(ts_, method, it->second));
    } catch(const body_error& e){
        // only reachable when load() reported the same error and the caller ignored it
        llvm::errs() << "[recsyn][loader] body of method #" << method << " failed to lower: " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace recsyn
