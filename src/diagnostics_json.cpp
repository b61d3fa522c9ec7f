#include "gocore/diagnostics_json.hpp"
#include "gocore/env.hpp"
#include <sstream>
#include <cstdio>

namespace gocore {

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

std::string panic_to_json(const runtime_panic& p){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(p.code)
      <<",\"message\":"<<json_escape(p.what())
      <<",\"hint\":"<<json_escape(p.hint)
      <<"}";
    return os.str();
}

void maybe_print_json(const runtime_panic& p){
    if(!runtimeEnv().diagJson) return;
    auto js = panic_to_json(p);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace gocore
