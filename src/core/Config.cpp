#include "Config.h"
#include <algorithm>
#include <cctype>

namespace open_ports {

const char* sort_key_name(SortKey key){
    switch(key){
        case SortKey::Pid: return "PID";
        case SortKey::Port: return "Port";
        case SortKey::Program: return "Program";
    }
    return "Program";
}

bool parse_sort_key(const std::string& name, SortKey& out){
    std::string s=name; std::transform(s.begin(),s.end(),s.begin(),[](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(s=="pid") { out = SortKey::Pid; return true; }
    if(s=="port") { out = SortKey::Port; return true; }
    if(s=="program") { out = SortKey::Program; return true; }
    return false;
}

}
