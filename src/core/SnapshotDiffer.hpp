#pragma once
#include "Topology.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace usbbw {

enum class ChangeKind {
    Unchanged,
    New,
    Removed
};

struct DeviceChange {
    std::string path;
    std::string configKey;
    ChangeKind kind{ChangeKind::Unchanged};
    // Session-wide discovery ordinal, set once a device has been seen New
    std::optional<uint64_t> ordinal;
};

struct DiffResult {
    // Devices of the current snapshot in tree order, then removed devices
    // in the previous snapshot's tree order.
    std::vector<DeviceChange> changes;

    const DeviceChange* find(const std::string& path, ChangeKind kind) const;
    size_t count(ChangeKind kind) const;
};

// Discovery bookkeeping for one process lifetime. Owned by whoever runs the
// refresh loop and handed to every diff; never reset behind its back.
struct DiffSession {
    uint64_t nextOrdinal{1};
    // Keyed by device identity (path + config key)
    std::map<std::string, uint64_t> ordinals;

    std::optional<uint64_t> ordinalFor(const std::string& path,
                                       const std::string& configKey) const;
};

class SnapshotDiffer {
public:
    // A device is identified by its path and config key; the same path
    // holding a different device counts as Removed + New.
    static DiffResult diff(const Topology* previous,
                           const Topology& current,
                           DiffSession& session);

    static std::string identity(const std::string& path, const std::string& configKey);
};

const char* changeKindName(ChangeKind kind);

}
