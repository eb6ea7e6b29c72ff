#include "RefreshController.hpp"
#include "BandwidthAllocator.hpp"
#include "Logger.hpp"
#include <QTimer>
#include <utility>

namespace usbbw {

const ResolvedLabel* Snapshot::label(const std::string& path) const {
    auto it = labels.find(path);
    return it != labels.end() ? &it->second : nullptr;
}

std::string Snapshot::labelText(const Device& device) const {
    if (const auto* resolved = label(device.path.toString())) {
        return resolved->text;
    }
    return device.displayName();
}

class RefreshController::Private {
public:
    std::unique_ptr<AttributeSource> source;
    LabelResolver resolver;
    DiffSession session;
    std::shared_ptr<const Snapshot> current;
    QTimer* timer{nullptr};
    bool inFlight{false};
    uint64_t sequence{0};
};

RefreshController::RefreshController(std::unique_ptr<AttributeSource> source,
                                     LabelConfig config,
                                     QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->source = std::move(source);
    d->resolver = LabelResolver(std::move(config));

    d->timer = new QTimer(this);
    connect(d->timer, &QTimer::timeout, this, [this]() { refresh(); });
}

RefreshController::~RefreshController() {
    if (d->timer) {
        d->timer->stop();
    }
}

std::shared_ptr<const Snapshot> RefreshController::snapshot() const {
    return d->current;
}

const DiffSession& RefreshController::session() const {
    return d->session;
}

const LabelResolver& RefreshController::labels() const {
    return d->resolver;
}

AttributeSource& RefreshController::source() const {
    return *d->source;
}

void RefreshController::start(int intervalMs) {
    d->timer->start(intervalMs > 0 ? intervalMs : DEFAULT_REFRESH_MS);
}

void RefreshController::stop() {
    d->timer->stop();
}

bool RefreshController::isActive() const {
    return d->timer->isActive();
}

bool RefreshController::isRefreshing() const {
    return d->inFlight;
}

bool RefreshController::refresh() {
    if (d->inFlight) {
        LOG_DEBUG("refresh already running, skipping");
        return false;
    }

    struct InFlight {
        bool& flag;
        explicit InFlight(bool& f) : flag(f) { flag = true; }
        ~InFlight() { flag = false; }
    } guard(d->inFlight);

    RawTopology raw;
    try {
        raw = d->source->read();
    } catch (const UsbError& e) {
        LOG_ERROR(std::string("refresh failed: ") + e.what());
        emit refreshFailed(e.what());
        return false;
    }

    BuildResult built = TopologyBuilder::build(raw);

    auto next = std::make_shared<Snapshot>();
    next->sequence = ++d->sequence;
    next->topology = BandwidthAllocator::allocate(built.topology);
    next->warnings = std::move(built.warnings);

    auto previous = d->current;
    next->diff = SnapshotDiffer::diff(previous ? &previous->topology : nullptr,
                                      next->topology, d->session);
    next->labels = d->resolver.resolveAll(next->topology);

    std::shared_ptr<const Snapshot> published = next;
    d->current = published;
    publish(previous, published);
    return true;
}

void RefreshController::publish(const std::shared_ptr<const Snapshot>& previous,
                                const std::shared_ptr<const Snapshot>& current) {
    for (const auto& warning : current->warnings) {
        emit warningRaised(warning);
    }

    for (const auto& change : current->diff.changes) {
        if (change.kind == ChangeKind::New) {
            const auto* label = current->label(change.path);
            emit deviceAdded(change.path, label ? label->text : change.configKey,
                             change.ordinal.value_or(0));
        } else if (change.kind == ChangeKind::Removed) {
            const auto* label = previous ? previous->label(change.path) : nullptr;
            emit deviceRemoved(change.path, label ? label->text : change.configKey);
        }
    }

    emit snapshotReady(current);
}

}
