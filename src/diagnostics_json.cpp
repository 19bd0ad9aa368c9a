#include "recsyn/diagnostics_json.hpp"
#include <cstdio>
#include <sstream>

namespace recsyn {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

namespace {

void append_notes(std::ostringstream& os, const std::vector<LoadNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)<<",\"line\":"<<notes[i].line<<",\"col\":"<<notes[i].col<<"}";
    }
    os<<"]";
}

template<typename D>
void append_diagnostics(std::ostringstream& os, const std::vector<D>& ds){
    os<<"[";
    for(size_t i=0;i<ds.size(); ++i){
        const auto& d=ds[i]; if(i) os<<",";
        os<<"{\"code\":"<<json_escape(d.code)
          <<",\"message\":"<<json_escape(d.message)
          <<",\"hint\":"<<json_escape(d.hint)
          <<",\"line\":"<<d.line
          <<",\"col\":"<<d.col
          <<",\"notes\":";
        append_notes(os,d.notes);
        os<<"}";
    }
    os<<"]";
}

const char* kind_name(SymbolKind k){
    switch(k){
        case SymbolKind::Field: return "field";
        case SymbolKind::Property: return "property";
        case SymbolKind::Method: return "method";
    }
    return "?";
}

} // namespace

std::string diagnostics_to_json(const LoadResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":";
    append_diagnostics(os, r.errors);
    os<<",\"warnings\":";
    append_diagnostics(os, r.warnings);
    os<<"}";
    return os.str();
}

std::string verdicts_to_json(const TypeSystem& ts, const record::RecordDecompiler& rd,
                             const std::vector<record::MemberVerdict>& verdicts){
    std::ostringstream os;
    os<<"{\"type\":"<<json_escape(ts.definition(rd.record()).full_name())
      <<",\"inherited\":"<<(rd.is_inherited_record()?"true":"false")
      <<",\"order_known\":"<<(rd.ordered_members()?"true":"false")
      <<",\"auto_properties\":[";
    const auto& entries = rd.backing_fields().entries();
    for(size_t i=0;i<entries.size(); ++i){
        if(i) os<<",";
        os<<"{\"property\":"<<json_escape(ts.property(entries[i].first).name)
          <<",\"field\":"<<json_escape(ts.field(entries[i].second).name)<<"}";
    }
    os<<"],\"members\":[";
    for(size_t i=0;i<verdicts.size(); ++i){
        const auto& v=verdicts[i]; if(i) os<<",";
        os<<"{\"kind\":\""<<kind_name(v.member.kind)<<"\",\"name\":"<<json_escape(v.name)
          <<",\"generated\":"<<(v.generated?"true":"false")<<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const ClassifyEnv& env, const LoadResult& r){
    if(!env.diag_json) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace recsyn
