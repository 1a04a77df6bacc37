#include "JsonUtil.h"
#include <cstdio>
#include <ctime>

namespace open_ports {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size()+8);
    for(unsigned char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){ char buf[8]; snprintf(buf, sizeof(buf), "\\u%04x", c); out += buf; }
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm g{};
    gmtime_r(&t, &g);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &g);
    return buf;
}

}
}
