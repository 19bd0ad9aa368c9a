// diagnostics_json.hpp - JSON serialization for load diagnostics and member verdicts
#pragma once
#include <string>
#include <vector>

#include "recsyn/env.hpp"
#include "recsyn/loader.hpp"
#include "recsyn/record/record_decompiler.hpp"

namespace recsyn {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize load diagnostics to a compact JSON string.
std::string diagnostics_to_json(const LoadResult& r);

// {"type":"Point","inherited":false,"order_known":true,"auto_properties":[...],"members":[...]}
std::string verdicts_to_json(const TypeSystem& ts, const record::RecordDecompiler& rd,
                             const std::vector<record::MemberVerdict>& verdicts);

// If RECSYN_DIAG_JSON=1, print diagnostics JSON to stderr.
void maybe_print_json(const ClassifyEnv& env, const LoadResult& r);

} // namespace recsyn
