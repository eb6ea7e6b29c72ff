#pragma once
#include "AttributeSource.hpp"
#include "LabelResolver.hpp"
#include "SnapshotDiffer.hpp"
#include "Topology.hpp"
#include "TopologyBuilder.hpp"
#include <QObject>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace usbbw {

// Result of one refresh cycle, handed out read-only.
struct Snapshot {
    uint64_t sequence{0};
    Topology topology;  // pools allocated
    DiffResult diff;
    std::map<std::string, ResolvedLabel> labels;  // by device path
    std::vector<TopologyWarning> warnings;

    const ResolvedLabel* label(const std::string& path) const;
    std::string labelText(const Device& device) const;
};

// Owns the read -> build -> allocate -> diff -> label pipeline and the
// session state it threads between cycles.
class RefreshController : public QObject {
    Q_OBJECT

public:
    RefreshController(std::unique_ptr<AttributeSource> source,
                      LabelConfig config,
                      QObject* parent = nullptr);
    ~RefreshController();

    std::shared_ptr<const Snapshot> snapshot() const;
    const DiffSession& session() const;
    const LabelResolver& labels() const;
    AttributeSource& source() const;

    void start(int intervalMs);
    void stop();
    bool isActive() const;
    bool isRefreshing() const;

public slots:
    // Returns false when the cycle failed or another one is still running.
    bool refresh();

signals:
    void snapshotReady(std::shared_ptr<const usbbw::Snapshot> snapshot);
    void deviceAdded(const std::string& path, const std::string& label, uint64_t ordinal);
    void deviceRemoved(const std::string& path, const std::string& label);
    void warningRaised(const usbbw::TopologyWarning& warning);
    void refreshFailed(const std::string& message);

private:
    void publish(const std::shared_ptr<const Snapshot>& previous,
                 const std::shared_ptr<const Snapshot>& current);

    class Private;
    std::unique_ptr<Private> d;
};

}
