#ifndef RCGC_HEAP_GRAPH_HPP
#define RCGC_HEAP_GRAPH_HPP

#include "common/common.hpp"
#include "heap/object.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Receives allocation and deallocation events from the reference graph.
// Implemented by the collector controller.
class HeapObserver {
public:
    virtual ~HeapObserver() = default;

    // Called after the object has been inserted (strong count 1, held by the host)
    virtual void onObjectAllocated(RcObject& object) = 0;

    // Called right before the object is erased from the graph
    virtual void onObjectFreed(const RcObject& object) = 0;
};

// Reference graph: id-indexed table of all live objects.
// Every edge A -> B accounts for exactly one unit of B's strong count,
// every host binding (root) accounts for one more. Objects are freed
// synchronously when their count drops to zero.
//
// All operations lock the graph mutex, which the collector also holds for
// the duration of a pass. The mutex is recursive so that finalizers running
// inside a pass can mutate the graph.
class ReferenceGraph {
public:
    ReferenceGraph();
    ~ReferenceGraph();

    ReferenceGraph(const ReferenceGraph&) = delete;
    ReferenceGraph& operator=(const ReferenceGraph&) = delete;

    void setObserver(HeapObserver* observer);

    // Allocate a new object. The caller owns the initial (root) reference.
    ObjectId allocate(RcObject::Kind kind, const std::string& typeName = "object");
    ObjectId allocateContainer(const std::string& typeName = "container");
    ObjectId allocateAtom(const std::string& typeName = "atom");

    // Host bindings
    void retain(ObjectId id);
    void release(ObjectId id);

    // Container slots
    void addEdge(ObjectId from, ObjectId to);
    void removeEdge(ObjectId from, ObjectId to);

    void setFinalizer(ObjectId id, RcObject::Finalizer finalizer);

    // Queries
    bool contains(ObjectId id) const;
    RcObject* find(ObjectId id);
    const RcObject* find(ObjectId id) const;
    RcObject& get(ObjectId id);
    const RcObject& get(ObjectId id) const;
    size_t strongCount(ObjectId id) const;
    std::vector<ObjectId> references(ObjectId id) const;
    std::vector<ObjectId> roots() const;
    size_t objectCount() const;

    // Objects freed since construction, by either reclamation path
    size_t freedCount() const { return freedCount_; }

    std::recursive_mutex& mutex() const { return mutex_; }

    // Collector interface
    void dropReference(ObjectId target);
    void destroy(ObjectId id);
    void runFinalizer(RcObject& object);

private:
    bool finalizeBeforeFree(RcObject& object);

    std::unordered_map<ObjectId, std::unique_ptr<RcObject>> objects_;
    ObjectId nextId_;
    size_t freedCount_;
    HeapObserver* observer_;
    mutable std::recursive_mutex mutex_;
};

#endif // RCGC_HEAP_GRAPH_HPP
