#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "recsyn/diagnostics_json.hpp"
#include "recsyn/env.hpp"
#include "recsyn/loader.hpp"
#include "recsyn/record/record_decompiler.hpp"

using namespace recsyn;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

template<typename D>
static void print_diagnostic(const char* severity, const D& d){
    std::cerr << severity; if(!d.code.empty()) std::cerr << "["<<d.code<<"]"; std::cerr << ": " << d.message;
    if(d.line>=0) std::cerr << " (line "<<d.line<<":"<<d.col<<")";
    std::cerr << "\n";
    if(!d.hint.empty()) std::cerr << "  hint: " << d.hint << "\n";
    for(auto &n : d.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line "<<n.line<<":"<<n.col<<")"; std::cerr << "\n"; }
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: recsyn_driver <module.edn> [--json] [--dump] [--type NAME]\n"; return 1; }
    std::string file = argv[1];
    ClassifyEnv env = detectEnv();
    bool json = false;
    std::string only;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a=="--json") json = true;
        else if(a=="--dump") env.dump_bodies = true;
        else if(a=="--type" && i+1<argc) only = argv[++i];
        else { std::cerr << "unknown argument: " << a << "\n"; return 1; }
    }
    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }

    TypeSystem ts;
    ModuleLoader loader(ts);
    auto res = loader.load(src);
    maybe_print_json(env, res);
    for(auto &e : res.errors) print_diagnostic("error", e);
    for(auto &w : res.warnings) print_diagnostic("warning", w);
    if(!res.success){ std::cerr << "Module load failed\n"; return 2; }

    bool found = false;
    for(auto def : loader.loaded_types()){
        const auto& td = ts.definition(def);
        if(!only.empty()){ if(td.full_name()!=only && td.name!=only) continue; }
        else if(!record::is_record_candidate(ts, def)) continue;
        found = true;
        record::RecordDecompiler rd(ts, def, loader, CancellationToken{}, env);
        auto verdicts = rd.classify_all();
        if(json){ std::cout << verdicts_to_json(ts, rd, verdicts) << "\n"; continue; }
        std::cout << "record " << td.full_name() << (rd.is_inherited_record() ? " (inherited)" : "")
                  << (rd.ordered_members() ? "" : " (member order unknown)") << "\n";
        for(auto& e : rd.backing_fields().entries())
            std::cout << "  auto-property " << ts.property(e.first).name << " -> " << ts.field(e.second).name << "\n";
        for(auto& v : verdicts)
            std::cout << "  " << (v.member.kind==SymbolKind::Property ? "property " : "method ") << v.name
                      << ": " << (v.generated ? "generated" : "user") << "\n";
    }
    if(!found){ std::cerr << (only.empty() ? "no record types in module\n" : "type not found: " + only + "\n"); return 3; }
    return 0;
}
