// Interned type representation for the record analysis.
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace recsyn
{

    using TypeId = uint32_t;
    using TypeDefId = uint32_t;

    constexpr uint32_t invalid_id = 0xFFFFFFFFu;

    // System types the matchers need to recognize by identity.
    enum class KnownTypeCode
    {
        None,
        Object,
        Void,
        Boolean,
        Int32,
        String,
        Type,
        RuntimeTypeHandle,
        ValueType,
        StringBuilder,
        EqualityComparerOf1,
        IEquatableOf1,
        CompilerGeneratedAttribute
    };

    struct Type
    {
        enum class Kind
        {
            Definition,    // def + args (args empty for non-generic types)
            TypeParameter, // owner + index
            Dynamic,
            Nullable, // nullable reference annotation around element
            ByRef
        } kind;
        TypeDefId def{invalid_id};  // Definition / TypeParameter owner
        std::vector<TypeId> args;   // Definition
        uint32_t index{0};          // TypeParameter
        std::string name;           // TypeParameter
        TypeId element{invalid_id}; // Nullable / ByRef
    };

    class TypeContext
    {
    public:
        TypeContext() { dynamic_ = add_type(Type{Type::Kind::Dynamic, invalid_id, {}, 0, "dynamic", invalid_id}); }

        TypeId get_definition(TypeDefId def, const std::vector<TypeId> &args = {})
        {
            auto key = std::make_pair(def, args);
            auto it = def_cache_.find(key);
            if (it != def_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Definition;
            t.def = def;
            t.args = args;
            TypeId id = add_type(std::move(t));
            def_cache_[key] = id;
            return id;
        }
        TypeId get_type_parameter(TypeDefId owner, uint32_t index, const std::string &name)
        {
            auto key = std::make_pair(owner, index);
            auto it = tp_cache_.find(key);
            if (it != tp_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::TypeParameter;
            t.def = owner;
            t.index = index;
            t.name = name;
            TypeId id = add_type(std::move(t));
            tp_cache_[key] = id;
            return id;
        }
        TypeId get_dynamic() const { return dynamic_; }
        TypeId get_nullable(TypeId element)
        {
            // T?? collapses; annotations never nest
            if (at(element).kind == Type::Kind::Nullable)
                return element;
            return get_wrapper(Type::Kind::Nullable, element, nullable_cache_);
        }
        TypeId get_byref(TypeId element) { return get_wrapper(Type::Kind::ByRef, element, byref_cache_); }

        const Type &at(TypeId id) const { return types_.at(id); }
        size_t size() const { return types_.size(); }

    private:
        std::vector<Type> types_;
        TypeId dynamic_{invalid_id};
        std::map<std::pair<TypeDefId, std::vector<TypeId>>, TypeId> def_cache_;
        std::map<std::pair<TypeDefId, uint32_t>, TypeId> tp_cache_;
        std::unordered_map<TypeId, TypeId> nullable_cache_;
        std::unordered_map<TypeId, TypeId> byref_cache_;

        TypeId add_type(Type t)
        {
            types_.push_back(std::move(t));
            return static_cast<TypeId>(types_.size() - 1);
        }
        TypeId get_wrapper(Type::Kind kind, TypeId element, std::unordered_map<TypeId, TypeId> &cache)
        {
            auto it = cache.find(element);
            if (it != cache.end())
                return it->second;
            Type t{};
            t.kind = kind;
            t.element = element;
            TypeId id = add_type(std::move(t));
            cache[element] = id;
            return id;
        }
    };

} // namespace recsyn
