#include "FilterEngine.h"
#include "../core/Errors.h"
#include <algorithm>

namespace open_ports {

std::regex FilterEngine::compile(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
        throw ConfigError("Invalid --regex pattern '" + pattern + "': " + ex.what());
    }
}

FilterEngine::FilterEngine(const FilterOptions& opts)
    : listening_only_(opts.listening_only), proto_(opts.proto) {
    if (opts.pattern) regex_ = compile(*opts.pattern);
}

bool FilterEngine::accepts(const UnifiedRecord& r) const {
    if (listening_only_ && r.state != ConnState::Listen) return false;
    if (proto_ == "tcp" && is_udp(r.protocol)) return false;
    if (proto_ == "udp" && !is_udp(r.protocol)) return false;
    if (regex_) {
        bool name_hit = r.program && std::regex_search(*r.program, *regex_);
        if (!name_hit && !std::regex_search(std::to_string(r.local.port), *regex_)) return false;
    }
    return true;
}

std::vector<UnifiedRecord> FilterEngine::apply(std::vector<UnifiedRecord> records) const {
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [this](const UnifiedRecord& r){ return !accepts(r); }),
                  records.end());
    return records;
}

}
