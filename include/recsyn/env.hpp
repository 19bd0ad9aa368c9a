#pragma once
#include <string>

namespace recsyn {

struct ClassifyEnv {
    bool trace_rejects = false; // RECSYN_TRACE=1
    bool dump_bodies = false;   // RECSYN_DUMP_BODIES=1
    bool diag_json = false;     // RECSYN_DIAG_JSON=1
};

// Reads process env vars and constructs a ClassifyEnv.
ClassifyEnv detectEnv();

// Matcher tracing to llvm::errs(): "[recsyn][<matcher>] reject <Type>::<Member>: <reason>"
void trace_reject(const ClassifyEnv& env, const char* matcher, const std::string& member, const char* reason);

} // namespace recsyn
