#pragma once
#include "../core/Types.h"
#include <memory>
#include <string>

namespace open_ports {

// Produces one read-only snapshot of the host's sockets and processes.
class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;
    virtual std::string name() const = 0;
    // Throws EnumerationError when no connection table can be read at all.
    virtual Snapshot snapshot() = 0;
};

using SnapshotSourcePtr = std::shared_ptr<SnapshotSource>;

}
