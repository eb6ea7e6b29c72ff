#pragma once
#include "LabelResolver.hpp"
#include "RefreshController.hpp"
#include <QObject>
#include <cstdint>
#include <memory>
#include <string>

namespace usbbw {

struct ListOptions {
    bool periodicOnly{false};
    bool verbose{false};
};

// Text renderings of a snapshot. Everything is read-only over the snapshot.
class ExportManager : public QObject {
    Q_OBJECT

public:
    explicit ExportManager(LabelResolver labels, QObject* parent = nullptr);
    ~ExportManager();

    std::string summary(const Snapshot& snapshot) const;
    std::string deviceList(const Snapshot& snapshot, const ListOptions& options = {}) const;
    std::string recommendations(const Snapshot& snapshot, uint64_t requiredBps = 0) const;

    // Mermaid flowchart honouring the "mermaid" configuration section
    std::string mermaid(const Snapshot& snapshot) const;
    // Summary table plus the flowchart in a fenced block
    std::string markdown(const Snapshot& snapshot) const;

    // Configuration document seeded from the snapshot, existing labels kept
    std::string generateConfig(const Snapshot& snapshot) const;

    // stdout when filename is empty
    bool write(const std::string& content, const std::string& filename);

    static std::string mermaidNodeId(const std::string& path);
    static std::string formatInterval(const Endpoint& endpoint);

signals:
    void exportComplete(const std::string& filename);
    void exportError(const std::string& error);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
