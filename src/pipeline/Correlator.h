#pragma once
#include "../core/Types.h"
#include <vector>

namespace open_ports {

// Joins each connection with its owning process name. The pid->name map is
// built once per snapshot; output keeps the connection order.
std::vector<UnifiedRecord> correlate(const Snapshot& snapshot);

}
