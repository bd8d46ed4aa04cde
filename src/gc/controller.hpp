#ifndef RCGC_GC_CONTROLLER_HPP
#define RCGC_GC_CONTROLLER_HPP

#include "common/common.hpp"
#include "heap/graph.hpp"
#include "gc/generations.hpp"
#include "gc/collector.hpp"
#include <array>
#include <functional>
#include <vector>

// Debug flags, combined as a bitmask
enum DebugFlag : unsigned {
    DEBUG_STATS         = 1 << 0,  // log a summary of every pass
    DEBUG_COLLECTABLE   = 1 << 1,  // log every reclaimed object
    DEBUG_UNCOLLECTABLE = 1 << 2,  // log every object kept alive by a finalizer
    DEBUG_SAVEALL       = 1 << 5,  // keep unreachable objects in garbage() instead of freeing them
    DEBUG_LEAK          = DEBUG_COLLECTABLE | DEBUG_UNCOLLECTABLE | DEBUG_SAVEALL
};

// What happens when a finalizer makes an unreachable object reachable again.
// The object is never freed in that pass; RAISE additionally reports it to the
// caller of collect() once the pass has completed.
enum class ResurrectionPolicy {
    DEFER,
    RAISE
};

struct GCConfig {
    Thresholds thresholds = DEFAULT_THRESHOLDS;
    bool enabled = true;
    unsigned debugFlags = 0;
    ResurrectionPolicy resurrectionPolicy = ResurrectionPolicy::DEFER;
};

struct GenerationStats {
    size_t collections = 0;
    size_t collected = 0;
    size_t uncollectable = 0;
};

enum class CollectionPhase {
    START,
    STOP
};

struct CollectionInfo {
    int generation;
    size_t collected;
    size_t uncollectable;
};

using CollectionCallback = std::function<void(CollectionPhase, const CollectionInfo&)>;

// Single-pass sequence over the containers tracked at the time it was created.
// Objects freed after that point are skipped when the sequence reaches them.
class TrackedObjects {
public:
    TrackedObjects(const ReferenceGraph& graph, std::vector<ObjectId> ids);

    // Stores the next live id in `id`; returns false once exhausted
    bool next(ObjectId& id);

    // Consumes the rest of the sequence
    std::vector<ObjectId> remaining();

    size_t snapshotSize() const { return ids_.size(); }

private:
    const ReferenceGraph* graph_;
    std::vector<ObjectId> ids_;
    size_t position_;
};

// Public control surface of the collector. Observes the reference graph,
// feeds the generation tracker and runs the cycle collector when a threshold
// is crossed or when asked to. The graph must outlive the controller.
class CollectorController : public HeapObserver {
public:
    explicit CollectorController(ReferenceGraph& graph, const GCConfig& config = GCConfig());
    ~CollectorController() override;

    CollectorController(const CollectorController&) = delete;
    CollectorController& operator=(const CollectorController&) = delete;

    // Manual collection, runs even when automatic collection is disabled.
    // Returns the number of containers reclaimed.
    size_t collect();
    size_t collect(int generation);

    void enable();
    void disable();
    bool isEnabled() const;

    void setThresholds(size_t t0, size_t t1, size_t t2);
    Thresholds getThresholds() const;
    std::array<size_t, NUM_GENERATIONS> getCount() const;

    // Introspection
    TrackedObjects getTrackedObjects() const;
    bool isTracked(ObjectId id) const;
    int generationOf(ObjectId id) const;
    std::vector<ObjectId> getReferents(ObjectId id) const;
    std::vector<ObjectId> getReferrers(ObjectId id) const;

    // Diagnostics
    std::array<GenerationStats, NUM_GENERATIONS> getStats() const;
    size_t totalCollected() const;
    size_t totalCollections() const;
    bool isCollecting() const;

    void setDebugFlags(unsigned flags);
    unsigned debugFlags() const;
    void setResurrectionPolicy(ResurrectionPolicy policy);
    ResurrectionPolicy resurrectionPolicy() const;

    // Objects kept by DEBUG_SAVEALL
    std::vector<ObjectId> garbage() const;
    size_t clearGarbage();

    void addCallback(CollectionCallback callback);
    void clearCallbacks();

    // HeapObserver
    void onObjectAllocated(RcObject& object) override;
    void onObjectFreed(const RcObject& object) override;

private:
    struct PassOutcome {
        size_t collected;
        std::vector<ObjectId> resurrected;
        int nextGeneration;
    };

    PassOutcome runPass(int generation);
    void collectAutomatic();
    void invokeCallbacks(CollectionPhase phase, const CollectionInfo& info);

    ReferenceGraph& graph_;
    GenerationTracker tracker_;
    CycleCollector collector_;
    bool enabled_;
    unsigned debugFlags_;
    ResurrectionPolicy resurrectionPolicy_;
    bool collecting_;
    GenerationStats stats_[NUM_GENERATIONS];
    std::vector<ObjectId> garbage_;
    std::vector<CollectionCallback> callbacks_;
};

#endif // RCGC_GC_CONTROLLER_HPP
