// EDN reader + printer.
#include "recsyn/edn.hpp"
#include <cctype>
#include <sstream>

namespace recsyn::edn {

namespace {

struct reader {
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get(){
        if(eof()) return '\0';
        char c = d[p++];
        if(c == '\n'){ ++line; col = 1; } else { ++col; }
        return c;
    }
    [[noreturn]] void fail(const std::string& msg) const { throw parse_error(msg, line, col); }
    void skip_ws(){
        while(!eof()){
            char c = peek();
            if(c == ';'){ while(!eof() && get() != '\n') {} continue; }
            // commas are whitespace in EDN
            if(c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',' || c == '\f' || c == '\v'){ get(); continue; }
            break;
        }
    }
};

bool is_digit(char c){ return c >= '0' && c <= '9'; }
bool is_symbol_start(char c){
    return std::isalpha(static_cast<unsigned char>(c)) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+'
        || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&';
}
// '`' is part of generic arity suffixes (EqualityComparer`1)
bool is_symbol_char(char c){ return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == '`' || c == '\''; }

node_ptr make_node(node_data d, int line, int col){
    auto n = std::make_shared<node>();
    n->data = std::move(d); n->line = line; n->col = col;
    return n;
}

node_ptr parse_value(reader& r);

node_ptr parse_seq(reader& r, char end, bool as_vector, int sl, int sc){
    std::vector<node_ptr> elems;
    r.skip_ws();
    while(!r.eof() && r.peek() != end){
        elems.push_back(parse_value(r));
        r.skip_ws();
    }
    if(r.get() != end) throw parse_error("unterminated collection", sl, sc);
    if(as_vector){ vector_t v; v.elems = std::move(elems); return make_node(std::move(v), sl, sc); }
    list l; l.elems = std::move(elems);
    return make_node(std::move(l), sl, sc);
}

node_ptr parse_string(reader& r){
    int sl = r.line, sc = r.col;
    r.get(); // opening quote
    std::string out;
    for(;;){
        if(r.eof()) throw parse_error("unterminated string", sl, sc);
        char c = r.get();
        if(c == '"') break;
        if(c != '\\'){ out += c; continue; }
        if(r.eof()) r.fail("bad escape");
        char e = r.get();
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            default: out += e; break;
        }
    }
    return make_node(std::move(out), sl, sc);
}

node_ptr parse_atom(reader& r){
    int sl = r.line, sc = r.col;
    bool kw = false;
    if(r.peek() == ':'){ kw = true; r.get(); }
    std::string s;
    while(is_symbol_char(r.peek())) s += r.get();
    if(s.empty()) r.fail("empty symbol");
    if(kw) return make_node(keyword{s}, sl, sc);
    if(s == "nil") return make_node(std::monostate{}, sl, sc);
    if(s == "true") return make_node(true, sl, sc);
    if(s == "false") return make_node(false, sl, sc);
    // numbers: optional sign followed by digits only
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if(i < s.size() && is_digit(s[i])){
        size_t j = i;
        while(j < s.size() && is_digit(s[j])) ++j;
        if(j != s.size()) throw parse_error("invalid number '" + s + "'", sl, sc);
        try {
            return make_node(static_cast<int64_t>(std::stoll(s)), sl, sc);
        } catch(const std::out_of_range&){
            throw parse_error("integer out of range '" + s + "'", sl, sc);
        }
    }
    return make_node(symbol{s}, sl, sc);
}

node_ptr parse_value(reader& r){
    r.skip_ws();
    int sl = r.line, sc = r.col;
    char c = r.peek();
    switch(c){
        case '"': return parse_string(r);
        case '(': r.get(); return parse_seq(r, ')', false, sl, sc);
        case '[': r.get(); return parse_seq(r, ']', true, sl, sc);
        default: break;
    }
    if(c == ':' || is_digit(c) || is_symbol_start(c)) return parse_atom(r);
    if(r.eof()) r.fail("unexpected end of input");
    r.fail(std::string("unexpected character '") + c + "'");
}

} // namespace

node_ptr parse(std::string_view src){
    reader r(src);
    auto v = parse_value(r);
    r.skip_ws();
    if(!r.eof()) r.fail("trailing content after single form");
    return v;
}

std::string to_string(const node& n){
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(const std::string& s) const { return '"' + s + '"'; }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string join(const std::vector<node_ptr>& elems, char o, char c) const {
            std::string out(1, o);
            for(size_t i = 0; i < elems.size(); ++i){ if(i) out += ' '; out += to_string(elems[i]); }
            out += c;
            return out;
        }
        std::string operator()(const list& l) const { return join(l.elems, '(', ')'); }
        std::string operator()(const vector_t& v) const { return join(v.elems, '[', ']'); }
    };
    return std::visit(V{}, n.data);
}

form_view split_form(const list& l, size_t start){
    form_view out;
    for(size_t i = start; i < l.elems.size();){
        const auto& e = l.elems[i];
        if(e && is_keyword(*e)){
            node_ptr value = (i + 1 < l.elems.size()) ? l.elems[i + 1] : nullptr;
            out.kwargs.emplace_back(std::get<keyword>(e->data).name, value);
            i += 2;
        } else {
            out.positional.push_back(e);
            ++i;
        }
    }
    return out;
}

} // namespace recsyn::edn
