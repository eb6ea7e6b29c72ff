#include "SnapshotDiffer.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <set>

namespace usbbw {

const DeviceChange* DiffResult::find(const std::string& path, ChangeKind kind) const {
    for (const auto& change : changes) {
        if (change.path == path && change.kind == kind) {
            return &change;
        }
    }
    return nullptr;
}

size_t DiffResult::count(ChangeKind kind) const {
    return static_cast<size_t>(std::count_if(changes.begin(), changes.end(),
        [kind](const DeviceChange& change) { return change.kind == kind; }));
}

std::optional<uint64_t> DiffSession::ordinalFor(const std::string& path,
                                                const std::string& configKey) const {
    auto it = ordinals.find(SnapshotDiffer::identity(path, configKey));
    if (it == ordinals.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string SnapshotDiffer::identity(const std::string& path, const std::string& configKey) {
    return path + "|" + configKey;
}

DiffResult SnapshotDiffer::diff(const Topology* previous,
                                const Topology& current,
                                DiffSession& session) {
    DiffResult result;

    std::set<std::string> previousIds;
    if (previous) {
        for (DeviceIndex index : previous->devicesInTreeOrder()) {
            const Device& device = previous->device(index);
            previousIds.insert(identity(device.path.toString(), device.configKey()));
        }
    }

    std::set<std::string> currentIds;
    for (DeviceIndex index : current.devicesInTreeOrder()) {
        const Device& device = current.device(index);
        DeviceChange change;
        change.path = device.path.toString();
        change.configKey = device.configKey();

        std::string id = identity(change.path, change.configKey);
        currentIds.insert(id);

        if (previousIds.count(id)) {
            change.kind = ChangeKind::Unchanged;
        } else {
            change.kind = ChangeKind::New;
            // First sighting fixes the ordinal; a device coming back keeps it.
            auto it = session.ordinals.find(id);
            if (it == session.ordinals.end()) {
                it = session.ordinals.emplace(id, session.nextOrdinal++).first;
                LOG_DEBUG("discovered " + change.path + " (" + change.configKey +
                          ") as #" + std::to_string(it->second));
            }
        }

        auto known = session.ordinals.find(id);
        if (known != session.ordinals.end()) {
            change.ordinal = known->second;
        }
        result.changes.push_back(std::move(change));
    }

    if (previous) {
        for (DeviceIndex index : previous->devicesInTreeOrder()) {
            const Device& device = previous->device(index);
            DeviceChange change;
            change.path = device.path.toString();
            change.configKey = device.configKey();
            if (currentIds.count(identity(change.path, change.configKey))) {
                continue;
            }
            change.kind = ChangeKind::Removed;
            change.ordinal = session.ordinalFor(change.path, change.configKey);
            result.changes.push_back(std::move(change));
        }
    }

    return result;
}

const char* changeKindName(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Unchanged: return "Unchanged";
        case ChangeKind::New:       return "New";
        case ChangeKind::Removed:   return "Removed";
    }
    return "Unknown";
}

}
