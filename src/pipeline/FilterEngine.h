#pragma once
#include "../core/Types.h"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace open_ports {

struct FilterOptions {
    bool listening_only = false;
    std::string proto; // "tcp" | "udp" | empty
    std::optional<std::string> pattern;
};

class FilterEngine {
public:
    // Throws ConfigError when the pattern does not compile.
    explicit FilterEngine(const FilterOptions& opts);

    static std::regex compile(const std::string& pattern);

    // A record must pass every active filter.
    bool accepts(const UnifiedRecord& r) const;
    std::vector<UnifiedRecord> apply(std::vector<UnifiedRecord> records) const;

private:
    bool listening_only_;
    std::string proto_;
    std::optional<std::regex> regex_;
};

}
