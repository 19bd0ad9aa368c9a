// Type definitions and members (fields, properties, methods) of a loaded module.
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "recsyn/types.hpp"

namespace recsyn
{

    using FieldId = uint32_t;
    using PropertyId = uint32_t;
    using MethodId = uint32_t;

    enum class Accessibility
    {
        None,
        Private,
        ProtectedAndInternal,
        Protected,
        Internal,
        ProtectedOrInternal,
        Public
    };

    enum class TypeKind
    {
        Class,
        Struct,
        Interface
    };

    enum class SymbolKind
    {
        Field,
        Property,
        Method
    };

    // Stable handle for a member of any kind.
    struct SymbolRef
    {
        SymbolKind kind;
        uint32_t id;
        bool operator==(const SymbolRef &o) const { return kind == o.kind && id == o.id; }
        bool operator!=(const SymbolRef &o) const { return !(*this == o); }
    };

    struct Attribute
    {
        TypeId type;
    };

    struct Parameter
    {
        std::string name;
        TypeId type;
    };

    struct MemberBase
    {
        std::string name;
        TypeDefId declaring{invalid_id};
        Accessibility access{Accessibility::Private};
        bool is_static{false};
        std::vector<Attribute> attributes;
    };

    struct FieldDef : MemberBase
    {
        TypeId type{invalid_id};
        bool is_readonly{false};
    };

    struct MethodDef : MemberBase
    {
        std::vector<Parameter> params;
        TypeId ret{invalid_id};
        std::vector<Attribute> return_attributes;
        bool is_virtual{false};
        bool is_override{false};
        bool is_sealed{false};
        bool is_abstract{false};
        bool is_operator{false};
        bool is_explicit_interface_impl{false};
        bool has_body{false};
        PropertyId accessor_owner{invalid_id};

        bool is_overridable() const { return (is_virtual || is_override || is_abstract) && !is_sealed; }
    };

    struct PropertyDef : MemberBase
    {
        TypeId type{invalid_id};
        MethodId getter{invalid_id};
        MethodId setter{invalid_id};
        std::vector<Parameter> params; // indexer parameters
        bool is_explicit_interface_impl{false};

        bool can_get() const { return getter != invalid_id; }
        bool can_set() const { return setter != invalid_id; }
    };

    struct TypeDefinition
    {
        std::string ns;
        std::string name;
        TypeKind kind{TypeKind::Class};
        KnownTypeCode known{KnownTypeCode::None};
        std::vector<TypeId> type_params;
        std::vector<TypeId> direct_base_types;
        std::vector<FieldId> fields;
        std::vector<PropertyId> properties;
        std::vector<MethodId> methods;
        std::vector<Attribute> attributes;
        TypeId self_type{invalid_id}; // definition instantiated with its own type parameters

        std::string full_name() const { return ns.empty() ? name : ns + "." + name; }
    };

    // Reference to a member as it appears inside an instruction: the definition
    // plus the (possibly instantiated) declaring type.
    struct FieldRef
    {
        FieldId def{invalid_id};
        TypeId declaring_type{invalid_id};
        bool operator==(const FieldRef &o) const { return def == o.def && declaring_type == o.declaring_type; }
        bool operator!=(const FieldRef &o) const { return !(*this == o); }
    };

    struct MethodRef
    {
        MethodId def{invalid_id};
        TypeId declaring_type{invalid_id};
        bool operator==(const MethodRef &o) const { return def == o.def && declaring_type == o.declaring_type; }
        bool operator!=(const MethodRef &o) const { return !(*this == o); }
    };

    class TypeSystem
    {
    public:
        TypeContext &types() { return types_; }
        const TypeContext &types() const { return types_; }

        TypeDefId add_definition(TypeDefinition def);
        FieldId add_field(TypeDefId owner, FieldDef f);
        MethodId add_method(TypeDefId owner, MethodDef m);
        PropertyId add_property(TypeDefId owner, PropertyDef p);

        const TypeDefinition &definition(TypeDefId id) const { return defs_.at(id); }
        TypeDefinition &definition(TypeDefId id) { return defs_.at(id); }
        const FieldDef &field(FieldId id) const { return fields_.at(id); }
        const MethodDef &method(MethodId id) const { return methods_.at(id); }
        MethodDef &method(MethodId id) { return methods_.at(id); }
        const PropertyDef &property(PropertyId id) const { return properties_.at(id); }
        size_t definition_count() const { return defs_.size(); }

        std::optional<TypeDefId> find_definition(const std::string &full_name) const;
        std::optional<FieldId> find_field(TypeDefId owner, const std::string &name) const;
        std::optional<PropertyId> find_property(TypeDefId owner, const std::string &name) const;
        // First method with that name (and parameter count, when given) in declaration order.
        std::optional<MethodId> find_method(TypeDefId owner, const std::string &name, std::optional<size_t> param_count = std::nullopt) const;
        std::optional<TypeId> known_type(KnownTypeCode code) const;
        // Definition behind a type, looking through nullable annotations.
        std::optional<TypeDefId> definition_of(TypeId type) const;

        bool is_known(TypeId type, KnownTypeCode code) const;
        // Equal after erasure: nullable annotations dropped, `dynamic` read as object.
        bool erasure_equivalent(TypeId a, TypeId b) const;

        // Property accessor flags (a property is virtual when its accessors are).
        bool property_is_virtual(PropertyId id) const;
        bool property_is_override(PropertyId id) const;
        bool property_is_sealed(PropertyId id) const;

        std::string type_name(TypeId type) const;
        std::string member_name(SymbolRef ref) const;

    private:
        TypeContext types_;
        std::vector<TypeDefinition> defs_;
        std::vector<FieldDef> fields_;
        std::vector<MethodDef> methods_;
        std::vector<PropertyDef> properties_;
        std::unordered_map<std::string, TypeDefId> by_name_;
        std::unordered_map<int, TypeDefId> known_;

        const MethodDef *primary_accessor(PropertyId id) const;
    };

} // namespace recsyn
