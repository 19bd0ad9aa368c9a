#pragma once

#include "recsyn/record/context.hpp"

namespace recsyn::record {

// Scans the declared properties of ctx.def and records every automatic one:
// getter `return this.<P>k__BackingField` (or the static load), setter
// `this.<P>k__BackingField = value; return`, both on the same field of the
// record type. Checks ctx.token once per property.
BackingFieldMap detect_auto_properties(const RecordContext& ctx);

// Property declaration order when every declared field backs an automatic
// property; otherwise unknown.
MemberOrder detect_member_order(const TypeSystem& ts, TypeDefId def, const BackingFieldMap& fields);

} // namespace recsyn::record
