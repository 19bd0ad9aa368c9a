#include "recsyn/env.hpp"
#include <cstdlib>

#include <llvm/Support/raw_ostream.h>

namespace recsyn {

ClassifyEnv detectEnv(){
    ClassifyEnv e{};
    auto flag = [](const char* k){
        const char* v = std::getenv(k);
        return v && (v[0]=='1' || v[0]=='y' || v[0]=='Y' || v[0]=='t' || v[0]=='T');
    };
    e.trace_rejects = flag("RECSYN_TRACE");
    e.dump_bodies = flag("RECSYN_DUMP_BODIES");
    e.diag_json = flag("RECSYN_DIAG_JSON");
    return e;
}

void trace_reject(const ClassifyEnv& env, const char* matcher, const std::string& member, const char* reason){
    if(!env.trace_rejects) return;
    llvm::errs() << "[recsyn][" << matcher << "] reject " << member << ": " << reason << "\n";
}

} // namespace recsyn
