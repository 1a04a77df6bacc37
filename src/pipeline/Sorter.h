#pragma once
#include "../core/Config.h"
#include "../core/Types.h"
#include <vector>

namespace open_ports {

// Stable sort. Records lacking the key (no pid, no program name) go last;
// Port compares local ports numerically; Program compares case-insensitively.
void sort_records(std::vector<UnifiedRecord>& records, SortKey key);

}
