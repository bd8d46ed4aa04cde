// Cycle Collector Implementation
#include "gc/collector.hpp"
#include <unordered_set>

CycleCollector::CycleCollector(ReferenceGraph& graph) : graph_(graph) {}

CycleCollector::Index CycleCollector::buildIndex(const std::vector<RcObject*>& members) {
    Index index;
    index.reserve(members.size());
    for (RcObject* object : members) {
        index.emplace(object->id(), object);
    }
    return index;
}

void CycleCollector::computeExternalCounts(const std::vector<RcObject*>& members, const Index& index) {
    for (RcObject* object : members) {
        object->setGcRefs(static_cast<int64_t>(object->strongCount()));
    }

    // Subtract every reference that originates inside the set
    for (RcObject* object : members) {
        for (ObjectId ref : object->references()) {
            auto it = index.find(ref);
            if (it != index.end()) {
                it->second->decGcRefs();
            }
        }
    }

    for (RcObject* object : members) {
        if (object->gcRefs() < 0) {
            throw GCError("reference count of object #" + std::to_string(object->id()) +
                          " is lower than its incoming edges");
        }
    }
}

void CycleCollector::grayObject(RcObject* object) {
    if (object->color() != RcObject::Color::WHITE) return;

    object->setColor(RcObject::Color::GRAY);
    grayStack_.push_back(object);
}

void CycleCollector::blackenObject(RcObject* object, const Index& index) {
    object->setColor(RcObject::Color::BLACK);

    // Only edges into the set matter, everything else is not being collected
    for (ObjectId ref : object->references()) {
        auto it = index.find(ref);
        if (it != index.end()) {
            grayObject(it->second);
        }
    }
}

void CycleCollector::markReachable(const std::vector<RcObject*>& members, const Index& index) {
    for (RcObject* object : members) {
        object->setColor(RcObject::Color::WHITE);
    }

    for (RcObject* object : members) {
        if (object->gcRefs() > 0) {
            grayObject(object);
        }
    }

    while (!grayStack_.empty()) {
        RcObject* object = grayStack_.back();
        grayStack_.pop_back();
        blackenObject(object, index);
    }
}

// Returns true if at least one finalizer ran
bool CycleCollector::runFinalizers(const std::vector<ObjectId>& unreachable) {
    bool ran = false;
    for (ObjectId id : unreachable) {
        // A finalizer that ran earlier may have freed this object
        RcObject* object = graph_.find(id);
        if (object == nullptr || !object->hasPendingFinalizer()) continue;

        graph_.runFinalizer(*object);
        ran = true;
    }
    return ran;
}

void CycleCollector::sweep(const std::vector<RcObject*>& garbage, CollectionResult& result,
                           const CollectOptions& options) {
    if (options.saveGarbage) {
        for (RcObject* object : garbage) {
            graph_.retain(object->id());
            result.collected.push_back(object->id());
        }
        return;
    }

    std::unordered_set<ObjectId> garbageIds;
    for (RcObject* object : garbage) {
        garbageIds.insert(object->id());
    }

    // Unlink first. Edges inside the garbage are dropped without touching counts,
    // edges leaving it are released once all garbage is gone.
    std::vector<ObjectId> outgoing;
    for (RcObject* object : garbage) {
        for (ObjectId ref : object->takeReferences()) {
            if (garbageIds.count(ref) == 0) {
                outgoing.push_back(ref);
            }
        }
    }

    for (RcObject* object : garbage) {
        ObjectId id = object->id();
        if (options.logCollectable) {
            Log::info("gc: collectable <" + object->typeName() + " #" + std::to_string(id) + ">");
        }
        result.collected.push_back(id);
        graph_.destroy(id);
    }

    for (ObjectId ref : outgoing) {
        graph_.dropReference(ref);
    }
}

CollectionResult CycleCollector::collect(int generation, const std::vector<ObjectId>& candidates,
                                         const CollectOptions& options) {
    CollectionResult result;
    result.generation = generation;

    std::vector<RcObject*> members;
    members.reserve(candidates.size());
    for (ObjectId id : candidates) {
        RcObject* object = graph_.find(id);
        // Objects on the eager release path are already being freed
        if (object != nullptr && object->isContainer() && !object->isFreeing()) {
            members.push_back(object);
        }
    }
    result.candidates = members.size();

    Index index = buildIndex(members);
    computeExternalCounts(members, index);
    markReachable(members, index);

    std::vector<ObjectId> survivorIds;
    std::vector<ObjectId> unreachable;
    for (RcObject* object : members) {
        if (object->color() == RcObject::Color::BLACK) {
            survivorIds.push_back(object->id());
        } else {
            unreachable.push_back(object->id());
        }
        object->setColor(RcObject::Color::WHITE);
    }

    if (!unreachable.empty()) {
        // Pointers are re-resolved after finalizers, which may free objects
        bool finalized = runFinalizers(unreachable);

        // Objects freed by reference counting while finalizers ran still
        // count as reclaimed by this pass
        std::vector<RcObject*> garbage;
        for (ObjectId id : unreachable) {
            RcObject* object = graph_.find(id);
            if (object != nullptr) {
                garbage.push_back(object);
            } else {
                result.collected.push_back(id);
            }
        }

        if (finalized && !garbage.empty()) {
            // Same analysis restricted to the garbage: anything a finalizer
            // made reachable from outside must survive this pass
            Index garbageIndex = buildIndex(garbage);
            computeExternalCounts(garbage, garbageIndex);
            markReachable(garbage, garbageIndex);

            std::vector<RcObject*> confirmed;
            for (RcObject* object : garbage) {
                if (object->color() == RcObject::Color::BLACK) {
                    result.resurrected.push_back(object->id());
                    survivorIds.push_back(object->id());
                    if (options.logUncollectable) {
                        Log::info("gc: uncollectable <" + object->typeName() + " #" +
                                  std::to_string(object->id()) + ">");
                    }
                } else {
                    confirmed.push_back(object);
                }
                object->setColor(RcObject::Color::WHITE);
            }
            garbage.swap(confirmed);
        }

        sweep(garbage, result, options);
        if (options.saveGarbage) {
            for (RcObject* object : garbage) {
                survivorIds.push_back(object->id());
            }
        }
    }

    for (ObjectId id : survivorIds) {
        RcObject* object = graph_.find(id);
        if (object != nullptr) {
            result.survivors.push_back(object);
        }
    }
    return result;
}
