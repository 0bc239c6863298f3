#include <gtest/gtest.h>

#include "turn_book.h"

TEST(TurnBookTest, OpenAssignsIncreasingIdsAndActivates) {
  TurnBook book;
  Turn &first = book.open(Side::A);
  EXPECT_EQ(first.id, 1u);
  Turn &second = book.open(Side::B);
  EXPECT_EQ(second.id, 2u);
  ASSERT_NE(book.active(), nullptr);
  EXPECT_EQ(book.active()->id, 2u);
  EXPECT_EQ(book.size(), 2u);
}

TEST(TurnBookTest, PartialIsIgnoredOnceFinalized) {
  TurnBook book;
  Turn &t = book.open(Side::A);
  EXPECT_TRUE(book.applyPartial("hel"));
  EXPECT_EQ(t.partial_text, "hel");

  t.final_text = "hello";
  t.finalized = true;
  EXPECT_FALSE(book.applyPartial("stale"));
  EXPECT_EQ(t.partial_text, "hel");
  EXPECT_EQ(t.final_text, "hello");
}

TEST(TurnBookTest, PartialWithoutActiveTurnIsRejected) {
  TurnBook book;
  EXPECT_FALSE(book.applyPartial("x"));
  book.open(Side::A);
  book.clearActive();
  EXPECT_FALSE(book.applyPartial("x"));
}

TEST(TurnBookTest, ClaimReusesOpenTurn) {
  TurnBook book;
  uint32_t id = book.open(Side::Undetermined).id;
  Turn &claimed = book.claimForCompletion(Side::B);
  EXPECT_EQ(claimed.id, id);
  EXPECT_EQ(book.size(), 1u);
}

TEST(TurnBookTest, ClaimCreatesTurnWhenNoneIsOpen) {
  TurnBook book;
  Turn &done = book.open(Side::A);
  done.finalized = true;

  Turn &claimed = book.claimForCompletion(Side::B);
  EXPECT_NE(claimed.id, done.id);
  EXPECT_EQ(claimed.side, Side::B);
  EXPECT_EQ(book.active()->id, claimed.id);
  EXPECT_EQ(book.size(), 2u);
}

TEST(TurnBookTest, DiscardClearsActive) {
  TurnBook book;
  uint32_t id = book.open(Side::A).id;
  book.discard(id);
  EXPECT_EQ(book.active(), nullptr);
  EXPECT_EQ(book.find(id), nullptr);
}

TEST(TurnBookTest, EvictsOldestFinalizedTurns) {
  TurnBook book(3);
  for (int i = 0; i < 5; i++) {
    book.open(Side::A).finalized = true;
  }
  EXPECT_EQ(book.size(), 3u);
  EXPECT_EQ(book.find(1), nullptr);
  EXPECT_EQ(book.find(2), nullptr);
  EXPECT_NE(book.find(5), nullptr);
}

TEST(TurnBookTest, NeverEvictsUnfinishedTurns) {
  TurnBook book(1);
  uint32_t pending = book.open(Side::A).id; // 未结束
  book.clearActive();
  book.open(Side::B);
  EXPECT_NE(book.find(pending), nullptr);
}
