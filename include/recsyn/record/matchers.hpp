#pragma once

#include "recsyn/record/context.hpp"

// Structural matchers for the members a record compiler synthesizes. Each
// returns true only for the exact compiler shape; any deviation is "hand-written".
// Entry points re-check the name and arity they are dispatched on.
namespace recsyn::record {

// protected virtual Type EqualityContract { [CompilerGenerated] get => typeof(R); }
bool is_generated_equality_contract(const RecordContext& ctx, PropertyId property);

// protected virtual bool PrintMembers(StringBuilder builder)
bool is_generated_print_members(const RecordContext& ctx, MethodId method);

// public override string ToString()
bool is_generated_to_string(const RecordContext& ctx, MethodId method);

// public virtual bool Equals(R other). Inherited records are never matched.
bool is_generated_equals(const RecordContext& ctx, MethodId method);

// public override int GetHashCode()
bool is_generated_get_hash_code(const RecordContext& ctx, MethodId method);

// op_Equality / op_Inequality taking (R, R); decided on the signature alone.
bool is_generated_comparison_operator(const RecordContext& ctx, MethodId method);

} // namespace recsyn::record
