#include "gc/generations.hpp"
#include <algorithm>

GenerationTracker::GenerationTracker()
    : GenerationTracker(DEFAULT_THRESHOLDS) {}

GenerationTracker::GenerationTracker(const Thresholds& thresholds)
    : thresholds_(DEFAULT_THRESHOLDS) {
    setThresholds(thresholds);
    counts_.fill(0);
    collections_.fill(0);
}

bool GenerationTracker::onContainerAllocated(RcObject& object) {
    object.setGeneration(0);
    buckets_[0].insert(object.id());
    return countAllocation();
}

bool GenerationTracker::onAtomAllocated() {
    return countAllocation();
}

bool GenerationTracker::countAllocation() {
    counts_[0]++;
    return counts_[0] > thresholds_[0];
}

void GenerationTracker::onDeallocated(const RcObject& object) {
    if (counts_[0] > 0) {
        counts_[0]--;
    }
    if (object.isContainer()) {
        untrack(object);
    }
}

void GenerationTracker::untrack(const RcObject& object) {
    int generation = object.generation();
    if (generation < 0 || generation > OLDEST_GENERATION) return;
    buckets_[generation].erase(object.id());
}

int GenerationTracker::onCollected(int generation, const std::vector<RcObject*>& survivors) {
    checkGeneration(generation);

    int target = std::min(generation + 1, OLDEST_GENERATION);
    for (RcObject* object : survivors) {
        if (object->generation() == target) {
            buckets_[target].insert(object->id());
            continue;
        }
        buckets_[object->generation()].erase(object->id());
        buckets_[target].insert(object->id());
        object->setGeneration(target);
    }

    for (int i = 0; i <= generation; i++) {
        counts_[i] = 0;
    }
    collections_[generation]++;

    if (generation < OLDEST_GENERATION) {
        counts_[generation + 1]++;
        if (counts_[generation + 1] >= thresholds_[generation + 1]) {
            return generation + 1;
        }
    }
    return -1;
}

std::vector<ObjectId> GenerationTracker::candidates(int generation) const {
    checkGeneration(generation);

    std::vector<ObjectId> result;
    for (int i = 0; i <= generation; i++) {
        result.insert(result.end(), buckets_[i].begin(), buckets_[i].end());
    }
    std::sort(result.begin(), result.end());
    return result;
}

const std::set<ObjectId>& GenerationTracker::bucket(int generation) const {
    checkGeneration(generation);
    return buckets_[generation];
}

bool GenerationTracker::isTracked(ObjectId id) const {
    return generationOf(id) >= 0;
}

int GenerationTracker::generationOf(ObjectId id) const {
    for (int i = 0; i < NUM_GENERATIONS; i++) {
        if (buckets_[i].count(id) > 0) return i;
    }
    return -1;
}

size_t GenerationTracker::trackedCount() const {
    size_t total = 0;
    for (const auto& bucket : buckets_) total += bucket.size();
    return total;
}

std::vector<ObjectId> GenerationTracker::trackedObjects() const {
    return candidates(OLDEST_GENERATION);
}

void GenerationTracker::validateThresholds(const Thresholds& thresholds) {
    for (int i = 0; i < NUM_GENERATIONS; i++) {
        if (thresholds[i] == 0) {
            throw InvalidConfiguration("threshold " + std::to_string(i) + " must be positive");
        }
    }
}

void GenerationTracker::setThresholds(const Thresholds& thresholds) {
    validateThresholds(thresholds);
    thresholds_ = thresholds;
}

size_t GenerationTracker::threshold(int generation) const {
    checkGeneration(generation);
    return thresholds_[generation];
}

size_t GenerationTracker::count(int generation) const {
    checkGeneration(generation);
    return counts_[generation];
}

size_t GenerationTracker::collections(int generation) const {
    checkGeneration(generation);
    return collections_[generation];
}

void GenerationTracker::checkGeneration(int generation) {
    if (generation < 0 || generation > OLDEST_GENERATION) {
        throw InvalidConfiguration("generation " + std::to_string(generation) +
                                   " out of range 0.." + std::to_string(OLDEST_GENERATION));
    }
}
