#include "recsyn/type_system.hpp"
#include <cassert>

namespace recsyn {

TypeDefId TypeSystem::add_definition(TypeDefinition def){
    TypeDefId id = static_cast<TypeDefId>(defs_.size());
    by_name_[def.full_name()] = id;
    if(def.known != KnownTypeCode::None) known_[static_cast<int>(def.known)] = id;
    defs_.push_back(std::move(def));
    return id;
}

FieldId TypeSystem::add_field(TypeDefId owner, FieldDef f){
    f.declaring = owner;
    FieldId id = static_cast<FieldId>(fields_.size());
    fields_.push_back(std::move(f));
    defs_.at(owner).fields.push_back(id);
    return id;
}

MethodId TypeSystem::add_method(TypeDefId owner, MethodDef m){
    m.declaring = owner;
    MethodId id = static_cast<MethodId>(methods_.size());
    methods_.push_back(std::move(m));
    defs_.at(owner).methods.push_back(id);
    return id;
}

PropertyId TypeSystem::add_property(TypeDefId owner, PropertyDef p){
    p.declaring = owner;
    PropertyId id = static_cast<PropertyId>(properties_.size());
    if(p.getter != invalid_id) methods_.at(p.getter).accessor_owner = id;
    if(p.setter != invalid_id) methods_.at(p.setter).accessor_owner = id;
    properties_.push_back(std::move(p));
    defs_.at(owner).properties.push_back(id);
    return id;
}

std::optional<TypeDefId> TypeSystem::find_definition(const std::string& full_name) const {
    auto it = by_name_.find(full_name);
    if(it == by_name_.end()) return std::nullopt;
    return it->second;
}

std::optional<FieldId> TypeSystem::find_field(TypeDefId owner, const std::string& name) const {
    for(auto id : defs_.at(owner).fields) if(fields_[id].name == name) return id;
    return std::nullopt;
}

std::optional<PropertyId> TypeSystem::find_property(TypeDefId owner, const std::string& name) const {
    for(auto id : defs_.at(owner).properties) if(properties_[id].name == name) return id;
    return std::nullopt;
}

std::optional<MethodId> TypeSystem::find_method(TypeDefId owner, const std::string& name, std::optional<size_t> param_count) const {
    for(auto id : defs_.at(owner).methods){
        const auto& m = methods_[id];
        if(m.name != name) continue;
        if(param_count && m.params.size() != *param_count) continue;
        return id;
    }
    return std::nullopt;
}

std::optional<TypeId> TypeSystem::known_type(KnownTypeCode code) const {
    auto it = known_.find(static_cast<int>(code));
    if(it == known_.end()) return std::nullopt;
    return defs_[it->second].self_type;
}

std::optional<TypeDefId> TypeSystem::definition_of(TypeId type) const {
    if(type == invalid_id) return std::nullopt;
    const Type* t = &types_.at(type);
    if(t->kind == Type::Kind::Nullable) t = &types_.at(t->element);
    if(t->kind != Type::Kind::Definition) return std::nullopt;
    return t->def;
}

bool TypeSystem::is_known(TypeId type, KnownTypeCode code) const {
    auto def = definition_of(type);
    if(!def) return false;
    return defs_[*def].known == code;
}

bool TypeSystem::erasure_equivalent(TypeId a, TypeId b) const {
    if(a == b) return true;
    if(a == invalid_id || b == invalid_id) return false;
    auto strip = [this](TypeId t){
        if(types_.at(t).kind == Type::Kind::Nullable) t = types_.at(t).element;
        if(types_.at(t).kind == Type::Kind::Dynamic){
            if(auto obj = known_type(KnownTypeCode::Object)) t = *obj;
        }
        return t;
    };
    a = strip(a); b = strip(b);
    if(a == b) return true;
    const Type& ta = types_.at(a);
    const Type& tb = types_.at(b);
    if(ta.kind != tb.kind) return false;
    switch(ta.kind){
        case Type::Kind::Definition:
            if(ta.def != tb.def || ta.args.size() != tb.args.size()) return false;
            for(size_t i = 0; i < ta.args.size(); ++i)
                if(!erasure_equivalent(ta.args[i], tb.args[i])) return false;
            return true;
        case Type::Kind::ByRef: return erasure_equivalent(ta.element, tb.element);
        case Type::Kind::TypeParameter: // interned: distinct ids are distinct parameters
        case Type::Kind::Dynamic:
        case Type::Kind::Nullable:
            return false;
    }
    return false;
}

const MethodDef* TypeSystem::primary_accessor(PropertyId id) const {
    const auto& p = properties_.at(id);
    if(p.getter != invalid_id) return &methods_.at(p.getter);
    if(p.setter != invalid_id) return &methods_.at(p.setter);
    return nullptr;
}

bool TypeSystem::property_is_virtual(PropertyId id) const { auto* m = primary_accessor(id); return m && m->is_virtual; }
bool TypeSystem::property_is_override(PropertyId id) const { auto* m = primary_accessor(id); return m && m->is_override; }
bool TypeSystem::property_is_sealed(PropertyId id) const { auto* m = primary_accessor(id); return m && m->is_sealed; }

std::string TypeSystem::type_name(TypeId type) const {
    if(type == invalid_id) return "<invalid>";
    const Type& t = types_.at(type);
    switch(t.kind){
        case Type::Kind::Dynamic: return "dynamic";
        case Type::Kind::TypeParameter: return t.name;
        case Type::Kind::Nullable: return type_name(t.element) + "?";
        case Type::Kind::ByRef: return type_name(t.element) + "&";
        case Type::Kind::Definition: {
            std::string s = defs_.at(t.def).full_name();
            if(t.args.empty()) return s;
            s += "[";
            for(size_t i = 0; i < t.args.size(); ++i){ if(i) s += ", "; s += type_name(t.args[i]); }
            s += "]";
            return s;
        }
    }
    return "<bad-type>";
}

std::string TypeSystem::member_name(SymbolRef ref) const {
    switch(ref.kind){
        case SymbolKind::Field: return fields_.at(ref.id).name;
        case SymbolKind::Property: return properties_.at(ref.id).name;
        case SymbolKind::Method: return methods_.at(ref.id).name;
    }
    assert(false && "unhandled symbol kind");
    return {};
}

} // namespace recsyn
