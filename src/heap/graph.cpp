#include "heap/graph.hpp"
#include <algorithm>

ReferenceGraph::ReferenceGraph()
    : nextId_(1), freedCount_(0), observer_(nullptr) {}

ReferenceGraph::~ReferenceGraph() {
    // Teardown frees everything without running finalizers or notifying
    observer_ = nullptr;
    objects_.clear();
}

void ReferenceGraph::setObserver(HeapObserver* observer) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    observer_ = observer;
}

ObjectId ReferenceGraph::allocate(RcObject::Kind kind, const std::string& typeName) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    ObjectId id = nextId_++;
    auto object = std::make_unique<RcObject>(id, kind, typeName);
    object->incRef();
    object->addRoot();

    RcObject* raw = object.get();
    objects_.emplace(id, std::move(object));

    // May run an automatic collection; the new object is rooted and survives it
    if (observer_) observer_->onObjectAllocated(*raw);
    return id;
}

ObjectId ReferenceGraph::allocateContainer(const std::string& typeName) {
    return allocate(RcObject::Kind::CONTAINER, typeName);
}

ObjectId ReferenceGraph::allocateAtom(const std::string& typeName) {
    return allocate(RcObject::Kind::ATOM, typeName);
}

void ReferenceGraph::retain(ObjectId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RcObject& object = get(id);
    object.addRoot();
    object.incRef();
}

void ReferenceGraph::release(ObjectId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RcObject& object = get(id);
    object.removeRoot();
    dropReference(id);
}

void ReferenceGraph::addEdge(ObjectId from, ObjectId to) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RcObject& source = get(from);
    RcObject& target = get(to);
    if (!source.isContainer()) {
        throw InvalidReference(from, "object is not a container");
    }

    source.appendReference(to);
    target.incRef();
}

void ReferenceGraph::removeEdge(ObjectId from, ObjectId to) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RcObject& source = get(from);
    if (!source.removeReference(to)) {
        throw InvalidReference(to, "no edge from object #" + std::to_string(from));
    }
    dropReference(to);
}

void ReferenceGraph::setFinalizer(ObjectId id, RcObject::Finalizer finalizer) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    get(id).setFinalizer(std::move(finalizer));
}

bool ReferenceGraph::contains(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return objects_.find(id) != objects_.end();
}

RcObject* ReferenceGraph::find(ObjectId id) {
    auto it = objects_.find(id);
    return it != objects_.end() ? it->second.get() : nullptr;
}

const RcObject* ReferenceGraph::find(ObjectId id) const {
    auto it = objects_.find(id);
    return it != objects_.end() ? it->second.get() : nullptr;
}

RcObject& ReferenceGraph::get(ObjectId id) {
    RcObject* object = find(id);
    if (object == nullptr) {
        throw InvalidReference(id, "unknown or freed object");
    }
    return *object;
}

const RcObject& ReferenceGraph::get(ObjectId id) const {
    const RcObject* object = find(id);
    if (object == nullptr) {
        throw InvalidReference(id, "unknown or freed object");
    }
    return *object;
}

size_t ReferenceGraph::strongCount(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return get(id).strongCount();
}

std::vector<ObjectId> ReferenceGraph::references(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return get(id).references();
}

std::vector<ObjectId> ReferenceGraph::roots() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<ObjectId> result;
    for (const auto& pair : objects_) {
        if (pair.second->rootCount() > 0) {
            result.push_back(pair.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ReferenceGraph::objectCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return objects_.size();
}

// Drops one strong reference. When the count reaches zero the object and
// everything that only it kept alive are freed. The cascade is iterative so
// long chains do not exhaust the native stack.
void ReferenceGraph::dropReference(ObjectId target) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RcObject& object = get(target);
    if (object.decRef() > 0) return;

    object.setFreeing(true);
    std::vector<ObjectId> pending;
    pending.push_back(target);

    while (!pending.empty()) {
        ObjectId current = pending.back();
        pending.pop_back();

        RcObject* dying = find(current);
        if (dying == nullptr) continue;

        // A finalizer of an object freed earlier in this cascade took a new reference
        if (dying->strongCount() > 0) {
            dying->setFreeing(false);
            continue;
        }
        if (dying->hasPendingFinalizer() && !finalizeBeforeFree(*dying)) continue;

        // Break all outgoing edges before the object goes away
        std::vector<ObjectId> refs = dying->takeReferences();
        for (ObjectId ref : refs) {
            RcObject* referent = find(ref);
            if (referent == nullptr) continue;
            if (referent->isFreeing() && referent->strongCount() == 0) continue;

            // Objects already queued stay queued when they drop back to zero
            if (referent->decRef() == 0 && !referent->isFreeing()) {
                referent->setFreeing(true);
                pending.push_back(ref);
            }
        }
        destroy(current);
    }
}

// Removes the object without touching the counts of its referents
void ReferenceGraph::destroy(ObjectId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        throw InvalidReference(id, "destroy of unknown object");
    }

    if (observer_) observer_->onObjectFreed(*it->second);
    objects_.erase(it);
    freedCount_++;
}

// The finalizer may free the object it belongs to, so only the id is used afterwards
void ReferenceGraph::runFinalizer(RcObject& object) {
    ObjectId id = object.id();
    try {
        object.runFinalizer();
    } catch (const std::exception& e) {
        Log::warning("exception in finalizer of object #" + std::to_string(id) + ": " + e.what());
    }
}

// Runs the finalizer of an object whose count just reached zero.
// Returns false if the finalizer resurrected the object.
bool ReferenceGraph::finalizeBeforeFree(RcObject& object) {
    // Hold a temporary reference while the hook runs
    object.incRef();
    object.setFreeing(false);

    runFinalizer(object);

    if (object.decRef() > 0) {
        Log::warning("object #" + std::to_string(object.id()) + " resurrected by its finalizer");
        return false;
    }
    object.setFreeing(true);
    return true;
}
