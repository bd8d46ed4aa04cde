#include <gtest/gtest.h>
#include "gc/generations.hpp"
#include <memory>

namespace {

std::unique_ptr<RcObject> makeContainer(ObjectId id) {
    return std::make_unique<RcObject>(id, RcObject::Kind::CONTAINER, "container");
}

} // namespace

TEST(GenerationsTest, DefaultThresholds) {
    GenerationTracker tracker;
    EXPECT_EQ(tracker.threshold(0), 700u);
    EXPECT_EQ(tracker.threshold(1), 10u);
    EXPECT_EQ(tracker.threshold(2), 10u);
    EXPECT_EQ(tracker.count(0), 0u);
}

TEST(GenerationsTest, NewContainersEnterGenerationZero) {
    GenerationTracker tracker;
    auto a = makeContainer(1);
    tracker.onContainerAllocated(*a);

    EXPECT_TRUE(tracker.isTracked(1));
    EXPECT_EQ(tracker.generationOf(1), 0);
    EXPECT_EQ(a->generation(), 0);
    EXPECT_EQ(tracker.bucket(0).size(), 1u);
    EXPECT_EQ(tracker.count(0), 1u);
}

TEST(GenerationsTest, PassDueOnceCountExceedsThreshold) {
    GenerationTracker tracker(Thresholds{{3, 10, 10}});
    std::vector<std::unique_ptr<RcObject>> objects;
    for (ObjectId id = 1; id <= 3; id++) {
        objects.push_back(makeContainer(id));
        EXPECT_FALSE(tracker.onContainerAllocated(*objects.back()));
    }
    objects.push_back(makeContainer(4));
    EXPECT_TRUE(tracker.onContainerAllocated(*objects.back()));
}

TEST(GenerationsTest, AtomsAreCountedButNotTracked) {
    GenerationTracker tracker(Thresholds{{2, 10, 10}});
    EXPECT_FALSE(tracker.onAtomAllocated());
    EXPECT_FALSE(tracker.onAtomAllocated());
    EXPECT_TRUE(tracker.onAtomAllocated());
    EXPECT_EQ(tracker.trackedCount(), 0u);
}

TEST(GenerationsTest, DeallocationUntracksAndLowersCount) {
    GenerationTracker tracker;
    auto a = makeContainer(1);
    RcObject atom(2, RcObject::Kind::ATOM, "atom");
    tracker.onContainerAllocated(*a);
    tracker.onAtomAllocated();
    EXPECT_EQ(tracker.count(0), 2u);

    tracker.onDeallocated(*a);
    tracker.onDeallocated(atom);
    EXPECT_FALSE(tracker.isTracked(1));
    EXPECT_EQ(tracker.count(0), 0u);

    // Never below zero
    tracker.onDeallocated(atom);
    EXPECT_EQ(tracker.count(0), 0u);
}

TEST(GenerationsTest, SurvivorsArePromoted) {
    GenerationTracker tracker;
    auto a = makeContainer(1);
    auto b = makeContainer(2);
    tracker.onContainerAllocated(*a);
    tracker.onContainerAllocated(*b);

    tracker.onCollected(0, {a.get()});
    EXPECT_EQ(tracker.generationOf(1), 1);
    EXPECT_EQ(a->generation(), 1);
    EXPECT_EQ(tracker.bucket(0).count(1), 0u);
    EXPECT_EQ(tracker.bucket(1).count(1), 1u);
    EXPECT_EQ(tracker.generationOf(2), 0);
    EXPECT_EQ(tracker.count(0), 0u);
    EXPECT_EQ(tracker.collections(0), 1u);

    tracker.onCollected(1, {a.get()});
    EXPECT_EQ(tracker.generationOf(1), 2);

    // The oldest generation keeps its survivors
    tracker.onCollected(2, {a.get()});
    EXPECT_EQ(tracker.generationOf(1), 2);
    EXPECT_EQ(tracker.bucket(2).size(), 1u);
}

TEST(GenerationsTest, YoungerSurvivorsOfOlderPassSkipAhead) {
    GenerationTracker tracker;
    auto a = makeContainer(1);
    tracker.onContainerAllocated(*a);

    tracker.onCollected(1, {a.get()});
    EXPECT_EQ(tracker.generationOf(1), 2);
}

TEST(GenerationsTest, OlderGenerationDueEveryNthPass) {
    GenerationTracker tracker(Thresholds{{1, 2, 2}});

    EXPECT_EQ(tracker.onCollected(0, {}), -1);
    EXPECT_EQ(tracker.count(1), 1u);
    EXPECT_EQ(tracker.onCollected(0, {}), 1);
    EXPECT_EQ(tracker.count(1), 2u);

    EXPECT_EQ(tracker.onCollected(1, {}), -1);
    EXPECT_EQ(tracker.count(1), 0u);
    EXPECT_EQ(tracker.count(2), 1u);

    tracker.onCollected(0, {});
    EXPECT_EQ(tracker.onCollected(0, {}), 1);
    EXPECT_EQ(tracker.onCollected(1, {}), 2);

    EXPECT_EQ(tracker.onCollected(2, {}), -1);
    EXPECT_EQ(tracker.count(2), 0u);
    EXPECT_EQ(tracker.collections(2), 1u);
}

TEST(GenerationsTest, CandidatesIncludeYoungerGenerations) {
    GenerationTracker tracker;
    auto a = makeContainer(1);
    auto b = makeContainer(2);
    auto c = makeContainer(3);
    tracker.onContainerAllocated(*a);
    tracker.onContainerAllocated(*b);
    tracker.onCollected(1, {a.get()});
    tracker.onCollected(0, {b.get()});
    tracker.onContainerAllocated(*c);

    EXPECT_EQ(tracker.candidates(0), (std::vector<ObjectId>{3}));
    EXPECT_EQ(tracker.candidates(1), (std::vector<ObjectId>{2, 3}));
    EXPECT_EQ(tracker.candidates(2), (std::vector<ObjectId>{1, 2, 3}));
    EXPECT_EQ(tracker.trackedObjects().size(), 3u);
}

TEST(GenerationsTest, NonPositiveThresholdIsRejected) {
    GenerationTracker tracker;
    EXPECT_THROW(tracker.setThresholds(Thresholds{{0, 10, 10}}), InvalidConfiguration);
    EXPECT_THROW(tracker.setThresholds(Thresholds{{700, 0, 10}}), InvalidConfiguration);
    EXPECT_THROW(tracker.setThresholds(Thresholds{{700, 10, 0}}), InvalidConfiguration);
    EXPECT_EQ(tracker.threshold(0), 700u);

    Thresholds invalid = {{0, 1, 1}};
    EXPECT_THROW(GenerationTracker rejected(invalid), InvalidConfiguration);
}

TEST(GenerationsTest, GenerationOutOfRange) {
    GenerationTracker tracker;
    EXPECT_THROW(tracker.candidates(3), InvalidConfiguration);
    EXPECT_THROW(tracker.count(-1), InvalidConfiguration);
    EXPECT_EQ(tracker.generationOf(99), -1);
}
