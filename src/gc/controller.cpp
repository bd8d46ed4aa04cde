#include "gc/controller.hpp"
#include <algorithm>
#include <sstream>

TrackedObjects::TrackedObjects(const ReferenceGraph& graph, std::vector<ObjectId> ids)
    : graph_(&graph), ids_(std::move(ids)), position_(0) {}

bool TrackedObjects::next(ObjectId& id) {
    while (position_ < ids_.size()) {
        ObjectId candidate = ids_[position_++];
        if (graph_->contains(candidate)) {
            id = candidate;
            return true;
        }
    }
    return false;
}

std::vector<ObjectId> TrackedObjects::remaining() {
    std::vector<ObjectId> result;
    ObjectId id = NO_OBJECT;
    while (next(id)) {
        result.push_back(id);
    }
    return result;
}

namespace {

// Clears the collecting flag however the pass ends
class CollectingScope {
public:
    explicit CollectingScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~CollectingScope() { flag_ = false; }

private:
    bool& flag_;
};

std::string generationSizes(const GenerationTracker& tracker) {
    std::ostringstream out;
    for (int i = 0; i < NUM_GENERATIONS; i++) {
        if (i > 0) out << " ";
        out << tracker.bucket(i).size();
    }
    return out.str();
}

} // namespace

CollectorController::CollectorController(ReferenceGraph& graph, const GCConfig& config)
    : graph_(graph), tracker_(config.thresholds), collector_(graph),
      enabled_(config.enabled), debugFlags_(config.debugFlags),
      resurrectionPolicy_(config.resurrectionPolicy), collecting_(false) {
    graph_.setObserver(this);
}

CollectorController::~CollectorController() {
    graph_.setObserver(nullptr);
}

size_t CollectorController::collect() {
    return collect(OLDEST_GENERATION);
}

size_t CollectorController::collect(int generation) {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    if (collecting_) {
        throw ReentrantCollection();
    }
    if (generation < 0 || generation > OLDEST_GENERATION) {
        throw InvalidConfiguration("invalid generation " + std::to_string(generation));
    }

    // Manual passes do not cascade into older generations
    PassOutcome outcome = runPass(generation);
    if (resurrectionPolicy_ == ResurrectionPolicy::RAISE && !outcome.resurrected.empty()) {
        throw ResurrectionDetected(outcome.resurrected, outcome.collected);
    }
    return outcome.collected;
}

CollectorController::PassOutcome CollectorController::runPass(int generation) {
    CollectingScope scope(collecting_);

    invokeCallbacks(CollectionPhase::START, CollectionInfo{generation, 0, 0});

    if (debugFlags_ & DEBUG_STATS) {
        Log::info("gc: collecting generation " + std::to_string(generation) +
                  "... objects in each generation: " + generationSizes(tracker_));
    }

    CollectOptions options;
    options.saveGarbage = (debugFlags_ & DEBUG_SAVEALL) != 0;
    options.logCollectable = (debugFlags_ & DEBUG_COLLECTABLE) != 0;
    options.logUncollectable = (debugFlags_ & DEBUG_UNCOLLECTABLE) != 0;

    CollectionResult result = collector_.collect(generation, tracker_.candidates(generation), options);

    PassOutcome outcome;
    outcome.collected = result.collected.size();
    outcome.resurrected = result.resurrected;
    outcome.nextGeneration = tracker_.onCollected(generation, result.survivors);

    stats_[generation].collections++;
    stats_[generation].collected += result.collected.size();
    stats_[generation].uncollectable += result.resurrected.size();

    if (options.saveGarbage) {
        garbage_.insert(garbage_.end(), result.collected.begin(), result.collected.end());
    }

    for (ObjectId id : result.resurrected) {
        Log::warning("object #" + std::to_string(id) +
                     " was resurrected by a finalizer and is left for a later pass");
    }

    if (debugFlags_ & DEBUG_STATS) {
        Log::info("gc: done, " + std::to_string(result.collected.size()) + " unreachable, " +
                  std::to_string(result.resurrected.size()) + " uncollectable, " +
                  std::to_string(result.candidates) + " examined");
    }
    Log::debug("pass " + std::to_string(generation) + " next=" + std::to_string(outcome.nextGeneration));

    invokeCallbacks(CollectionPhase::STOP,
                    CollectionInfo{generation, result.collected.size(), result.resurrected.size()});
    return outcome;
}

// Runs a generation 0 pass and whatever older passes it makes due
void CollectorController::collectAutomatic() {
    int generation = 0;
    while (generation >= 0) {
        PassOutcome outcome = runPass(generation);
        generation = outcome.nextGeneration;
    }
}

void CollectorController::invokeCallbacks(CollectionPhase phase, const CollectionInfo& info) {
    // Copy so a callback may register or clear callbacks
    std::vector<CollectionCallback> callbacks = callbacks_;
    for (const auto& callback : callbacks) {
        try {
            callback(phase, info);
        } catch (const std::exception& e) {
            Log::warning(std::string("exception in collection callback: ") + e.what());
        }
    }
}

void CollectorController::onObjectAllocated(RcObject& object) {
    bool due = object.isContainer() ? tracker_.onContainerAllocated(object)
                                    : tracker_.onAtomAllocated();

    // While a pass is running the count is kept; the next allocation re-checks it
    if (due && enabled_ && !collecting_) {
        collectAutomatic();
    }
}

void CollectorController::onObjectFreed(const RcObject& object) {
    tracker_.onDeallocated(object);
}

void CollectorController::enable() {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    enabled_ = true;
}

void CollectorController::disable() {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    enabled_ = false;
}

bool CollectorController::isEnabled() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return enabled_;
}

void CollectorController::setThresholds(size_t t0, size_t t1, size_t t2) {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    tracker_.setThresholds(Thresholds{{t0, t1, t2}});
}

Thresholds CollectorController::getThresholds() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return tracker_.thresholds();
}

std::array<size_t, NUM_GENERATIONS> CollectorController::getCount() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return tracker_.counts();
}

TrackedObjects CollectorController::getTrackedObjects() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return TrackedObjects(graph_, tracker_.trackedObjects());
}

bool CollectorController::isTracked(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return tracker_.isTracked(id);
}

int CollectorController::generationOf(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return tracker_.generationOf(id);
}

std::vector<ObjectId> CollectorController::getReferents(ObjectId id) const {
    return graph_.references(id);
}

std::vector<ObjectId> CollectorController::getReferrers(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    std::vector<ObjectId> result;
    for (ObjectId candidate : tracker_.trackedObjects()) {
        const RcObject* object = graph_.find(candidate);
        if (object == nullptr) continue;
        const auto& refs = object->references();
        if (std::find(refs.begin(), refs.end(), id) != refs.end()) {
            result.push_back(candidate);
        }
    }
    return result;
}

std::array<GenerationStats, NUM_GENERATIONS> CollectorController::getStats() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    std::array<GenerationStats, NUM_GENERATIONS> result;
    for (int i = 0; i < NUM_GENERATIONS; i++) {
        result[i] = stats_[i];
    }
    return result;
}

size_t CollectorController::totalCollected() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    size_t total = 0;
    for (const auto& stats : stats_) total += stats.collected;
    return total;
}

size_t CollectorController::totalCollections() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    size_t total = 0;
    for (const auto& stats : stats_) total += stats.collections;
    return total;
}

bool CollectorController::isCollecting() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return collecting_;
}

void CollectorController::setDebugFlags(unsigned flags) {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    debugFlags_ = flags;
}

unsigned CollectorController::debugFlags() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return debugFlags_;
}

void CollectorController::setResurrectionPolicy(ResurrectionPolicy policy) {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    resurrectionPolicy_ = policy;
}

ResurrectionPolicy CollectorController::resurrectionPolicy() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return resurrectionPolicy_;
}

std::vector<ObjectId> CollectorController::garbage() const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    return garbage_;
}

// Drops the references held for saved garbage. Returns how many were held.
size_t CollectorController::clearGarbage() {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    std::vector<ObjectId> saved;
    saved.swap(garbage_);
    for (ObjectId id : saved) {
        graph_.release(id);
    }
    return saved.size();
}

void CollectorController::addCallback(CollectionCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    callbacks_.push_back(std::move(callback));
}

void CollectorController::clearCallbacks() {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    callbacks_.clear();
}
