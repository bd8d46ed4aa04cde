#ifndef RCGC_GC_COLLECTOR_HPP
#define RCGC_GC_COLLECTOR_HPP

#include "common/common.hpp"
#include "heap/graph.hpp"
#include <unordered_map>
#include <vector>

// Outcome of one collection pass
struct CollectionResult {
    int generation = 0;
    size_t candidates = 0;
    std::vector<ObjectId> collected;    // reclaimed (or saved) containers
    std::vector<ObjectId> resurrected;  // kept alive by a finalizer, left for a later pass
    std::vector<RcObject*> survivors;   // live candidates, to be promoted
};

struct CollectOptions {
    bool saveGarbage = false;       // keep unreachable objects alive instead of freeing them
    bool logCollectable = false;
    bool logUncollectable = false;
};

// Cycle collector: finds candidate containers that are only reachable
// through references from other candidates and reclaims them.
//
// 1. external count = strong count - references from other candidates
// 2. everything reachable from a candidate with a non-zero external count is live
// 3. finalizers of the remaining objects run, then the check is repeated on
//    them so that objects a finalizer made reachable again are kept
// 4. the rest is unlinked and freed without cascading releases among itself
class CycleCollector {
public:
    explicit CycleCollector(ReferenceGraph& graph);

    CollectionResult collect(int generation, const std::vector<ObjectId>& candidates,
                             const CollectOptions& options);

private:
    using Index = std::unordered_map<ObjectId, RcObject*>;

    void computeExternalCounts(const std::vector<RcObject*>& members, const Index& index);
    void markReachable(const std::vector<RcObject*>& members, const Index& index);
    void grayObject(RcObject* object);
    void blackenObject(RcObject* object, const Index& index);
    bool runFinalizers(const std::vector<ObjectId>& unreachable);
    void sweep(const std::vector<RcObject*>& garbage, CollectionResult& result,
               const CollectOptions& options);

    static Index buildIndex(const std::vector<RcObject*>& members);

    ReferenceGraph& graph_;
    std::vector<RcObject*> grayStack_;
};

#endif // RCGC_GC_COLLECTOR_HPP
