#include <gtest/gtest.h>
#include <algorithm>
#include <type_traits>
#include "model/bottle.hpp"
#include "model/move.hpp"
#include "model/puzzle_state.hpp"

using namespace decanter;

namespace {

constexpr ColorId A = 0;
constexpr ColorId B = 1;
constexpr ColorId C = 2;

PuzzleState makeState(std::vector<Bottle> bottles) {
    return PuzzleState(std::move(bottles));
}

} // namespace

// ─── Bottle ────────────────────────────────────────────────────

TEST(ModelTest, BottleBasics) {
    Bottle b(4, {A, A, B});
    EXPECT_EQ(b.capacity(), 4);
    EXPECT_EQ(b.count(), 3);
    EXPECT_EQ(b.freeSpace(), 1);
    EXPECT_EQ(b.topColor(), B);
    EXPECT_EQ(b.contiguousTopCount(), 1);
    EXPECT_EQ(b.runCount(), 2);
    EXPECT_FALSE(b.isMonochrome());
    EXPECT_EQ(b.slot(0), A);
    EXPECT_EQ(b.slot(3), std::nullopt);
}

TEST(ModelTest, BottleNeedsCapacity) {
    EXPECT_FALSE(std::is_default_constructible<Bottle>::value);
    EXPECT_THROW(Bottle(0), std::invalid_argument);
}

TEST(ModelTest, EmptyBottle) {
    Bottle b(3);
    EXPECT_TRUE(b.isEmpty());
    EXPECT_EQ(b.topColor(), std::nullopt);
    EXPECT_EQ(b.contiguousTopCount(), 0);
    EXPECT_TRUE(b.isMonochrome());
    EXPECT_FALSE(b.isSolvedFull());
}

TEST(ModelTest, BottleRejectsMalformedInput) {
    EXPECT_THROW(Bottle(0), std::invalid_argument);
    EXPECT_THROW(Bottle(2, {A, A, A}), std::invalid_argument);
    EXPECT_THROW(Bottle(2, {-1}), std::invalid_argument);
    EXPECT_THROW(Bottle::fromSlots({A, std::nullopt, B}), std::invalid_argument);
}

TEST(ModelTest, BottleFromSlots) {
    Bottle b = Bottle::fromSlots({A, B, std::nullopt, std::nullopt});
    EXPECT_EQ(b.capacity(), 4);
    EXPECT_EQ(b.count(), 2);
    EXPECT_EQ(b.topColor(), B);
}

TEST(ModelTest, PourAmountIsTopRunLimitedByFreeSpace) {
    Bottle from(4, {B, A, A, A});
    EXPECT_EQ(from.maxPourAmountInto(Bottle(4)), 3);
    EXPECT_EQ(from.maxPourAmountInto(Bottle(4, {A, A})), 2);
    EXPECT_EQ(from.maxPourAmountInto(Bottle(4, {B})), 0);      // top mismatch
    EXPECT_EQ(from.maxPourAmountInto(Bottle(2, {A, A})), 0);   // target full
    EXPECT_EQ(Bottle(4).maxPourAmountInto(Bottle(4)), 0);      // empty source
}

TEST(ModelTest, SinkCannotBeSource) {
    Bottle sink(3, {A}, true);
    EXPECT_EQ(sink.maxPourAmountInto(Bottle(3)), 0);
    EXPECT_EQ(Bottle(3, {A}).maxPourAmountInto(sink), 1);
}

// ─── Puzzle State ──────────────────────────────────────────────

TEST(ModelTest, PourAmountRejectsBadIndices) {
    auto s = makeState({Bottle(2, {A}), Bottle(2)});
    EXPECT_EQ(s.pourAmount(0, 0), 0);
    EXPECT_EQ(s.pourAmount(-1, 1), 0);
    EXPECT_EQ(s.pourAmount(0, 2), 0);
    EXPECT_EQ(s.pourAmount(0, 1), 1);
}

TEST(ModelTest, LegalMovesAscendingOrder) {
    auto s = makeState({Bottle(3, {A, B}), Bottle(3, {B}), Bottle(3)});
    auto moves = s.legalMoves();
    ASSERT_EQ(moves.size(), 4u);
    EXPECT_EQ(moves[0], Move(0, 1, 1));
    EXPECT_EQ(moves[1], Move(0, 2, 1));
    EXPECT_EQ(moves[2], Move(1, 0, 1));
    EXPECT_EQ(moves[3], Move(1, 2, 1));
    EXPECT_EQ(s.legalMoveCount(), 4);
}

TEST(ModelTest, SearchPolicySkipsInterchangeableRelocation) {
    // Moving [B] whole into an identical empty bottle gives an isomorphic state
    auto s = makeState({Bottle(3, {A, B}), Bottle(3, {B}), Bottle(3)});
    EXPECT_TRUE(s.isRelocation(1, 2));
    EXPECT_FALSE(s.isRelocation(0, 2));

    auto moves = s.legalMoves(MovePolicy::SEARCH);
    ASSERT_EQ(moves.size(), 3u);
    EXPECT_EQ(std::count(moves.begin(), moves.end(), Move(1, 2, 1)), 0);
}

TEST(ModelTest, RelocationIntoDifferentCapacityIsKept) {
    auto s = makeState({Bottle(2, {A, A}), Bottle(4)});
    EXPECT_FALSE(s.isRelocation(0, 1));
    EXPECT_EQ(s.legalMoveCount(MovePolicy::SEARCH), 1);
}

TEST(ModelTest, SinkTargetsCanBeFiltered) {
    auto s = makeState({Bottle(2, {A, B}), Bottle(2, {}, true), Bottle(2, {A})});
    EXPECT_EQ(s.legalMoveCount(MovePolicy::PLAY, true), 2);    // 0->1, 2->1
    EXPECT_EQ(s.legalMoveCount(MovePolicy::PLAY, false), 0);
}

TEST(ModelTest, ApplyPourConservesColors) {
    auto s = makeState({Bottle(4, {A, B, B}), Bottle(4, {C, B}), Bottle(4, {A}), Bottle(4)});
    auto before = s.colorVolumes();
    for (const Move& m : s.legalMoves()) {
        PuzzleState next = s;
        next.applyPour(m);
        EXPECT_EQ(next.colorVolumes(), before) << "after " << m.toString();
        EXPECT_EQ(next.bottles[m.source].count(), s.bottles[m.source].count() - m.amount);
        EXPECT_EQ(next.bottles[m.target].count(), s.bottles[m.target].count() + m.amount);
    }
}

TEST(ModelTest, ApplyPourRejectsWrongAmount) {
    auto s = makeState({Bottle(4, {A, A}), Bottle(4)});
    EXPECT_THROW(s.applyPour(Move(0, 1, 1)), std::runtime_error);
    EXPECT_THROW(s.applyPour(Move(1, 0, 1)), std::runtime_error);
}

// ─── Win / Fail ────────────────────────────────────────────────

TEST(ModelTest, WinWhenEverythingSortedAndMerged) {
    EXPECT_TRUE(makeState({Bottle(2, {A, A}), Bottle(2)}).isWin());
    EXPECT_TRUE(makeState({Bottle(2, {A, A}), Bottle(2, {A, A})}).isWin());
    EXPECT_TRUE(makeState({Bottle(3, {A, A, A}), Bottle(3, {B, B, B}), Bottle(3)}).isWin());
}

TEST(ModelTest, NotWinWhenMergeIsLegal) {
    // Both bottles single-colored, but one can be emptied into the other
    auto s = makeState({Bottle(4, {A, A}), Bottle(4, {A, A})});
    EXPECT_FALSE(s.isWin());
}

TEST(ModelTest, NotWinWhenMergeIntoSinkIsLegal) {
    auto s = makeState({Bottle(2, {A}), Bottle(2, {A}, true)});
    EXPECT_FALSE(s.isWin());
}

TEST(ModelTest, NotWinWithMixedBottle) {
    EXPECT_FALSE(makeState({Bottle(2, {A, B}), Bottle(2)}).isWin());
}

TEST(ModelTest, PartialMergeDoesNotBlockWin) {
    // 3 units cannot fit into 1 free slot, so the bottles are maximally merged
    auto s = makeState({Bottle(3, {A, A, A}), Bottle(3, {A, A})});
    EXPECT_TRUE(s.isWin());
}

TEST(ModelTest, FailWhenOutOfMoves) {
    auto s = makeState({Bottle(2, {A, B}), Bottle(2, {B, A}), Bottle(2)});
    s.moves_allowed = 3;
    s.moves_used = 2;
    EXPECT_FALSE(s.isFail());
    s.moves_used = 3;
    EXPECT_TRUE(s.isFail());

    auto won = makeState({Bottle(2, {A, A}), Bottle(2)});
    won.moves_allowed = 1;
    won.moves_used = 5;
    EXPECT_FALSE(won.isFail());
}
