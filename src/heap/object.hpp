#ifndef RCGC_HEAP_OBJECT_HPP
#define RCGC_HEAP_OBJECT_HPP

#include "common/common.hpp"
#include <functional>
#include <string>
#include <vector>

// Allocation unit managed by the reference graph.
// Containers can hold outgoing references and are tracked by the cycle collector,
// atoms are leaf values reclaimed by reference counting alone.
class RcObject {
public:
    enum class Kind {
        ATOM,
        CONTAINER
    };

    // Marking colors used during a collection pass
    enum class Color {
        WHITE,  // not (yet) known to be reachable
        GRAY,   // reachable, referents not scanned
        BLACK   // reachable, referents scanned
    };

    // Pre-destruction hook, receives the id of the dying object
    using Finalizer = std::function<void(ObjectId)>;

    RcObject(ObjectId id, Kind kind, const std::string& typeName);

    ObjectId id() const { return id_; }
    Kind kind() const { return kind_; }
    bool isContainer() const { return kind_ == Kind::CONTAINER; }
    const std::string& typeName() const { return typeName_; }

    // Reference counting
    size_t strongCount() const { return strongCount_; }
    void incRef() { strongCount_++; }
    size_t decRef();

    // References held by bindings of the host (part of strongCount)
    size_t rootCount() const { return rootCount_; }
    void addRoot() { rootCount_++; }
    void removeRoot();

    // Generation bucket, only meaningful for containers
    int generation() const { return generation_; }
    void setGeneration(int generation) { generation_ = generation; }

    // Outgoing references, in insertion order
    const std::vector<ObjectId>& references() const { return references_; }
    void appendReference(ObjectId target);
    bool removeReference(ObjectId target);
    std::vector<ObjectId> takeReferences();

    // Set while the object is on the eager deallocation path
    bool isFreeing() const { return freeing_; }
    void setFreeing(bool freeing) { freeing_ = freeing; }

    // Finalizer support. A finalizer runs at most once per object.
    void setFinalizer(Finalizer finalizer) { finalizer_ = std::move(finalizer); }
    bool hasPendingFinalizer() const { return finalizer_ && !finalized_; }
    void runFinalizer();

    // Collector scratch state, valid only during a pass
    Color color() const { return color_; }
    void setColor(Color color) { color_ = color; }
    int64_t gcRefs() const { return gcRefs_; }
    void setGcRefs(int64_t refs) { gcRefs_ = refs; }
    void decGcRefs() { gcRefs_--; }

private:
    ObjectId id_;
    Kind kind_;
    std::string typeName_;
    size_t strongCount_;
    size_t rootCount_;
    int generation_;
    std::vector<ObjectId> references_;
    bool freeing_;
    Finalizer finalizer_;
    bool finalized_;
    Color color_;
    int64_t gcRefs_;
};

const char* kindName(RcObject::Kind kind);

#endif // RCGC_HEAP_OBJECT_HPP
