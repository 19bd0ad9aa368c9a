#include "recsyn/record/context.hpp"

#include <llvm/Support/raw_ostream.h>

#include "recsyn/il/dump.hpp"

namespace recsyn::record {

bool BackingFieldMap::add(PropertyId property, FieldId field){
    if(field_of(property) || property_of(field)) return false;
    entries_.emplace_back(property, field);
    return true;
}

std::optional<FieldId> BackingFieldMap::field_of(PropertyId property) const {
    for(auto& e : entries_) if(e.first == property) return e.second;
    return std::nullopt;
}

std::optional<PropertyId> BackingFieldMap::property_of(FieldId field) const {
    for(auto& e : entries_) if(e.second == field) return e.first;
    return std::nullopt;
}

bool RecordContext::is_record_type(TypeId type) const {
    if(type == invalid_id) return false;
    const Type* t = &ts.types().at(type);
    if(t->kind == Type::Kind::Nullable) t = &ts.types().at(t->element);
    return t->kind == Type::Kind::Definition && t->def == def && t->args == this->type().type_params;
}

std::string RecordContext::source_name() const {
    const std::string& name = type().name;
    auto tick = name.find('`');
    return tick == std::string::npos ? name : name.substr(0, tick);
}

std::optional<il::NormalizedBody> RecordContext::decompile_body(MethodId method) const {
    if(method == invalid_id) return std::nullopt;
    auto body = decompiler.decompile(method, token);
    if(body && env.dump_bodies){
        llvm::errs() << "[recsyn][dump] " << member_label(SymbolRef{SymbolKind::Method, method}) << "\n";
        il::dump(llvm::errs(), ts, *body);
    }
    return body;
}

std::string RecordContext::member_label(SymbolRef member) const {
    return type().name + "::" + ts.member_name(member);
}

bool RecordContext::reject(const char* matcher, SymbolRef member, const char* reason) const {
    if(env.trace_rejects) trace_reject(env, matcher, member_label(member), reason);
    return false;
}

bool has_base_record(const TypeSystem& ts, TypeDefId def){
    for(auto base : ts.definition(def).direct_base_types){
        auto bd = ts.definition_of(base);
        if(!bd) continue;
        const auto& b = ts.definition(*bd);
        if(b.kind == TypeKind::Class && b.known != KnownTypeCode::Object) return true;
    }
    return false;
}

} // namespace recsyn::record
