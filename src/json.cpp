#include "json.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
namespace mpay {
static void skip(const std::string& s, size_t& i){ while(i<s.size() && isspace((unsigned char)s[i])) ++i; }
static int hexval(char c){
    if(c>='0'&&c<='9') return c-'0';
    if(c>='a'&&c<='f') return 10+(c-'a');
    if(c>='A'&&c<='F') return 10+(c-'A');
    return -1;
}
static void put_utf8(std::ostringstream& o, unsigned cp){
    if(cp<0x80) o<<(char)cp;
    else if(cp<0x800){ o<<(char)(0xC0|(cp>>6)); o<<(char)(0x80|(cp&0x3F)); }
    else { o<<(char)(0xE0|(cp>>12)); o<<(char)(0x80|((cp>>6)&0x3F)); o<<(char)(0x80|(cp&0x3F)); }
}
static bool parse_string(const std::string& s, size_t& i, std::string& out){
    if(i>=s.size() || s[i]!='"') return false;
    ++i; std::ostringstream o;
    while(i<s.size() && s[i]!='"'){
        if(s[i]=='\\'){
            ++i; if(i>=s.size()) return false;
            char c=s[i];
            if(c=='"'||c=='\\'||c=='/') o<<c;
            else if(c=='b') o<<'\b';
            else if(c=='f') o<<'\f';
            else if(c=='n') o<<'\n';
            else if(c=='r') o<<'\r';
            else if(c=='t') o<<'\t';
            else if(c=='u'){
                if(i+4>=s.size()) return false;
                unsigned cp=0;
                for(int k=1;k<=4;k++){ int h=hexval(s[i+k]); if(h<0) return false; cp=(cp<<4)|(unsigned)h; }
                put_utf8(o, cp);
                i+=4;
            }
            else return false;
        } else o<<s[i];
        ++i;
    }
    if(i>=s.size()||s[i]!='"') return false;
    ++i; out=o.str(); return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out, int depth);
static bool parse_array(const std::string& s, size_t& i, JNode& out, int depth){
    ++i; skip(s,i); JArray arr;
    if(i<s.size() && s[i]==']'){ ++i; out.v=arr; return true; }
    while(i<s.size()){
        JNode val; if(!parse_value(s,i,val,depth+1)) return false;
        arr.push_back(val); skip(s,i);
        if(i<s.size() && s[i]==','){ ++i; skip(s,i); continue; }
        if(i<s.size() && s[i]==']'){ ++i; out.v=arr; return true; }
        return false;
    }
    return false;
}
static bool parse_object(const std::string& s, size_t& i, JNode& out, int depth){
    ++i; skip(s,i); JObject obj;
    if(i<s.size() && s[i]=='}'){ ++i; out.v=obj; return true; }
    while(i<s.size()){
        std::string k; if(!parse_string(s,i,k)) return false;
        skip(s,i); if(i>=s.size() || s[i]!=':') return false;
        ++i; skip(s,i);
        JNode val; if(!parse_value(s,i,val,depth+1)) return false;
        obj[k]=val; skip(s,i);
        if(i<s.size() && s[i]==','){ ++i; skip(s,i); continue; }
        if(i<s.size() && s[i]=='}'){ ++i; out.v=obj; return true; }
        return false;
    }
    return false;
}
static bool parse_number(const std::string& s, size_t& i, double& out){
    size_t j=i;
    if(i<s.size() && s[i]=='-') ++i;
    size_t digits=i;
    while(i<s.size() && isdigit((unsigned char)s[i])) ++i;
    if(i==digits) return false;
    if(i<s.size() && s[i]=='.'){ ++i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; }
    if(i<s.size() && (s[i]=='e'||s[i]=='E')){
        ++i; if(i<s.size() && (s[i]=='+'||s[i]=='-')) ++i;
        while(i<s.size()&&isdigit((unsigned char)s[i])) ++i;
    }
    try { out = std::stod(s.substr(j, i-j)); } catch(const std::exception&) { return false; }
    return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out, int depth){
    if(depth>64) return false;
    skip(s,i); if(i>=s.size()) return false;
    if(s[i]=='"'){ std::string str; if(!parse_string(s,i,str)) return false; out.v=str; return true; }
    if(s[i]=='{') return parse_object(s,i,out,depth);
    if(s[i]=='[') return parse_array(s,i,out,depth);
    if(s.compare(i,4,"true")==0){ i+=4; out.v=true; return true; }
    if(s.compare(i,5,"false")==0){ i+=5; out.v=false; return true; }
    if(s.compare(i,4,"null")==0){ i+=4; out.v=JNull{}; return true; }
    double num; if(parse_number(s,i,num)){ out.v=num; return true; }
    return false;
}
bool json_parse(const std::string& s, JNode& out){ size_t i=0; bool ok=parse_value(s,i,out,0); if(!ok) return false; skip(s,i); return i==s.size(); }

static void dump_string(const std::string& s, std::ostringstream& o){
    o<<'"';
    for(unsigned char c : s){
        switch(c){
            case '"': o<<"\\\""; break;
            case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break;
            case '\r': o<<"\\r"; break;
            case '\t': o<<"\\t"; break;
            case '\b': o<<"\\b"; break;
            case '\f': o<<"\\f"; break;
            default:
                if(c<0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", c); o<<buf; }
                else o<<(char)c;
        }
    }
    o<<'"';
}
static void dump_number(double d, std::ostringstream& o){
    // integral values (amounts, timestamps) print without exponent
    if(std::isfinite(d) && d==std::floor(d) && std::fabs(d)<9007199254740992.0){
        o<<(long long)d;
    } else if(std::isfinite(d)) {
        char buf[32]; std::snprintf(buf, sizeof(buf), "%.17g", d); o<<buf;
    } else {
        o<<"null";
    }
}
static void dump(const JNode& n, std::ostringstream& o){
    if(std::holds_alternative<JNull>(n.v)) o<<"null";
    else if(std::holds_alternative<bool>(n.v)) o<<(std::get<bool>(n.v)?"true":"false");
    else if(std::holds_alternative<double>(n.v)) dump_number(std::get<double>(n.v), o);
    else if(std::holds_alternative<std::string>(n.v)) dump_string(std::get<std::string>(n.v), o);
    else if(std::holds_alternative<JArray>(n.v)){ o<<'['; const auto& a=std::get<JArray>(n.v); for(size_t i=0;i<a.size();++i){ if(i) o<<','; dump(a[i],o);} o<<']'; }
    else { o<<'{'; const auto& m=std::get<JObject>(n.v); size_t i=0; for(auto& kv: m){ if(i++) o<<','; dump_string(kv.first,o); o<<':'; dump(kv.second,o);} o<<'}'; }
}
std::string json_dump(const JNode& n){ std::ostringstream o; dump(n,o); return o.str(); }

JNode jstr(const std::string& s){ JNode n; n.v=s; return n; }
JNode jnum(double d){ JNode n; n.v=d; return n; }
JNode jbool(bool b){ JNode n; n.v=b; return n; }
JNode jobj(const JObject& m){ JNode n; n.v=m; return n; }

static const JNode* member(const JNode& obj, const std::string& key){
    if(!std::holds_alternative<JObject>(obj.v)) return nullptr;
    const auto& m = std::get<JObject>(obj.v);
    auto it = m.find(key);
    return it==m.end() ? nullptr : &it->second;
}
bool json_get_string(const JNode& obj, const std::string& key, std::string& out){
    const JNode* n = member(obj, key);
    if(!n || !std::holds_alternative<std::string>(n->v)) return false;
    out = std::get<std::string>(n->v); return true;
}
bool json_get_u64(const JNode& obj, const std::string& key, uint64_t& out){
    const JNode* n = member(obj, key);
    if(!n || !std::holds_alternative<double>(n->v)) return false;
    double d = std::get<double>(n->v);
    if(d<0 || d!=std::floor(d) || d>=18446744073709551616.0) return false;
    out = (uint64_t)d; return true;
}
}
