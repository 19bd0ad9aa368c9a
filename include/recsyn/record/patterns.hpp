#pragma once

#include "recsyn/il/match.hpp"
#include "recsyn/record/context.hpp"

// Record-specific instruction patterns built on the il::match primitives.
namespace recsyn::record {

// callvirt System.Text.StringBuilder.Append(ldloc sb, value)
bool match_string_builder_append(const RecordContext& ctx, const il::Instruction* inst, const il::VariablePtr& sb,
                                 const il::Instruction*& value);
// Append(ldloc sb, ldstr text) with the exact text
bool match_append_literal(const RecordContext& ctx, const il::Instruction* inst, const il::VariablePtr& sb, const char* text);

// ldfld of `field` as declared on the record type.
bool match_ld_record_field(const RecordContext& ctx, const il::Instruction* inst, FieldId field, const il::Instruction*& target);

// callvirt get_EqualityContract(target)
bool match_get_equality_contract(const RecordContext& ctx, const il::Instruction* inst, const il::Instruction*& target);

// call EqualityComparer<T>.get_Default() with T erasure-equivalent to `type`.
bool is_equality_comparer_get_default_call(const TypeSystem& ts, const il::Instruction* inst, TypeId type);

// call System.Type.GetTypeFromHandle(ldtypetoken T)
bool match_get_type_from_handle(const TypeSystem& ts, const il::Instruction* inst, TypeId& type);

// Call or CallVirt of a method with this name; null otherwise.
const il::CallArgs* match_call_named(const TypeSystem& ts, const il::Instruction* inst, const char* name);

} // namespace recsyn::record
