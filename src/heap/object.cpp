#include "heap/object.hpp"
#include <algorithm>

RcObject::RcObject(ObjectId id, Kind kind, const std::string& typeName)
    : id_(id), kind_(kind), typeName_(typeName),
      strongCount_(0), rootCount_(0), generation_(0),
      freeing_(false), finalized_(false),
      color_(Color::WHITE), gcRefs_(0) {}

size_t RcObject::decRef() {
    if (strongCount_ == 0) {
        throw GCError("reference count underflow on object #" + std::to_string(id_));
    }
    return --strongCount_;
}

void RcObject::removeRoot() {
    if (rootCount_ == 0) {
        throw InvalidReference(id_, "no root reference to release");
    }
    rootCount_--;
}

void RcObject::appendReference(ObjectId target) {
    references_.push_back(target);
}

// Removes the first occurrence of target
bool RcObject::removeReference(ObjectId target) {
    auto it = std::find(references_.begin(), references_.end(), target);
    if (it == references_.end()) {
        return false;
    }
    references_.erase(it);
    return true;
}

std::vector<ObjectId> RcObject::takeReferences() {
    std::vector<ObjectId> refs;
    refs.swap(references_);
    return refs;
}

void RcObject::runFinalizer() {
    if (!hasPendingFinalizer()) return;

    // Mark first so a finalizer that drops the last reference to its own
    // object does not run twice
    finalized_ = true;
    Finalizer finalizer = finalizer_;
    finalizer(id_);
}

const char* kindName(RcObject::Kind kind) {
    switch (kind) {
        case RcObject::Kind::ATOM: return "atom";
        case RcObject::Kind::CONTAINER: return "container";
    }
    return "unknown";
}
