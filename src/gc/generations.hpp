#ifndef RCGC_GC_GENERATIONS_HPP
#define RCGC_GC_GENERATIONS_HPP

#include "common/common.hpp"
#include "heap/object.hpp"
#include <array>
#include <set>
#include <vector>

using Thresholds = std::array<size_t, NUM_GENERATIONS>;

// Default schedule: a generation 0 pass every 700 net allocations,
// generation 1 every 10th generation 0 pass, generation 2 every 10th generation 1 pass
constexpr Thresholds DEFAULT_THRESHOLDS = {{700, 10, 10}};

// Generation tracker: partitions container objects into age buckets and
// decides when a pass is due.
//
// count(0) is the number of allocations minus eager deallocations since the
// last pass. For g > 0, count(g) is the number of passes of generation g - 1
// since the last pass of generation g.
class GenerationTracker {
public:
    GenerationTracker();
    explicit GenerationTracker(const Thresholds& thresholds);

    // Allocation accounting. Return true once count(0) exceeds threshold(0).
    bool onContainerAllocated(RcObject& object);
    bool onAtomAllocated();
    void onDeallocated(const RcObject& object);

    // Completes a pass of the given generation: survivors are promoted and the
    // counters updated. Returns the older generation that is now due, or -1.
    int onCollected(int generation, const std::vector<RcObject*>& survivors);

    // Containers in generations 0..generation, oldest id first
    std::vector<ObjectId> candidates(int generation) const;

    const std::set<ObjectId>& bucket(int generation) const;
    bool isTracked(ObjectId id) const;
    int generationOf(ObjectId id) const;
    size_t trackedCount() const;
    std::vector<ObjectId> trackedObjects() const;

    void setThresholds(const Thresholds& thresholds);
    const Thresholds& thresholds() const { return thresholds_; }
    size_t threshold(int generation) const;
    size_t count(int generation) const;
    std::array<size_t, NUM_GENERATIONS> counts() const { return counts_; }

    // Passes completed per generation
    size_t collections(int generation) const;

    static void validateThresholds(const Thresholds& thresholds);

private:
    static void checkGeneration(int generation);
    bool countAllocation();
    void untrack(const RcObject& object);

    std::set<ObjectId> buckets_[NUM_GENERATIONS];
    Thresholds thresholds_;
    std::array<size_t, NUM_GENERATIONS> counts_;
    std::array<size_t, NUM_GENERATIONS> collections_;
};

#endif // RCGC_GC_GENERATIONS_HPP
