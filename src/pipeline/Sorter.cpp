#include "Sorter.h"
#include <algorithm>
#include <cctype>

namespace open_ports {

static bool less_ci(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y){ return std::tolower(x) < std::tolower(y); });
}

// Present values before absent ones; two absent values are equal.
template <typename T, typename Less>
static bool optional_less(const std::optional<T>& a, const std::optional<T>& b, Less less) {
    if (a && b) return less(*a, *b);
    return a.has_value() && !b.has_value();
}

void sort_records(std::vector<UnifiedRecord>& records, SortKey key) {
    switch (key) {
        case SortKey::Pid:
            std::stable_sort(records.begin(), records.end(), [](const UnifiedRecord& a, const UnifiedRecord& b){
                return optional_less(a.pid, b.pid, [](pid_t x, pid_t y){ return x < y; });
            });
            break;
        case SortKey::Port:
            std::stable_sort(records.begin(), records.end(), [](const UnifiedRecord& a, const UnifiedRecord& b){
                return a.local.port < b.local.port;
            });
            break;
        case SortKey::Program:
            std::stable_sort(records.begin(), records.end(), [](const UnifiedRecord& a, const UnifiedRecord& b){
                return optional_less(a.program, b.program, less_ci);
            });
            break;
    }
}

}
