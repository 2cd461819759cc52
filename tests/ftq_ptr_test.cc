#include <gtest/gtest.h>

#include "ftq_ptr.h"

TEST(FtqPtr, AddWrapsAndFlipsFlag) {
   ftq_ptr_t p(8, false, 6);
   ftq_ptr_t q = p + 3;
   EXPECT_TRUE(q.flag);
   EXPECT_EQ(1u, q.value);

   ftq_ptr_t r = q + 8;
   EXPECT_FALSE(r.flag);
   EXPECT_EQ(1u, r.value);
}

TEST(FtqPtr, SubtractUndoesAdd) {
   ftq_ptr_t p(8, true, 2);
   for (uint64_t n = 0; n < 20; n++)
      EXPECT_TRUE((p + n) - n == p) << "n=" << n;

   ftq_ptr_t q = p - 3;
   EXPECT_FALSE(q.flag);
   EXPECT_EQ(7u, q.value);
}

TEST(FtqPtr, OrderingAcrossTheWrap) {
   ftq_ptr_t a(8, false, 6);
   ftq_ptr_t b(8, true, 1);
   EXPECT_TRUE(is_after(b, a));
   EXPECT_TRUE(is_before(a, b));
   EXPECT_FALSE(is_after(a, b));
   EXPECT_FALSE(is_after(a, a));
   EXPECT_FALSE(is_before(a, a));
}

TEST(FtqPtr, DistanceFullAndEmpty) {
   ftq_ptr_t deq(8, false, 5);
   ftq_ptr_t enq(8, true, 2);
   EXPECT_EQ(5u, distance_between(enq, deq));
   EXPECT_FALSE(is_full(enq, deq));
   EXPECT_FALSE(is_empty(enq, deq));

   ftq_ptr_t full(8, true, 5);
   EXPECT_EQ(8u, distance_between(full, deq));
   EXPECT_TRUE(is_full(full, deq));
   EXPECT_FALSE(full == deq);

   EXPECT_EQ(0u, distance_between(deq, deq));
   EXPECT_TRUE(is_empty(deq, deq));
}

TEST(FtqPtrSet, StartsAtZero) {
   ftq_ptr_set_t p(8);
   EXPECT_EQ(0u, p.bpu.value);
   EXPECT_EQ(0u, p.ifu.value);
   EXPECT_EQ(1u, p.ifu_plus1.value);
   EXPECT_EQ(2u, p.ifu_plus2.value);
   EXPECT_EQ(1u, p.pf_plus1.value);
   EXPECT_EQ(1u, p.comm_plus1.value);
   EXPECT_TRUE(p.comm == p.rob_comm);
}

TEST(FtqPtrSet, RollbackRestartsAfterTheRedirect) {
   ftq_ptr_set_t p(8);
   ftq_ptr_t idx(8, false, 7);
   p.bpu = ftq_ptr_t(8, true, 3);
   p.ifu = ftq_ptr_t(8, true, 2);
   p.comm = ftq_ptr_t(8, false, 6);
   p.rollback(idx);

   EXPECT_TRUE(p.bpu == ftq_ptr_t(8, true, 0));
   EXPECT_TRUE(p.ifu == ftq_ptr_t(8, true, 0));
   EXPECT_TRUE(p.ifu_plus1 == ftq_ptr_t(8, true, 1));
   EXPECT_TRUE(p.ifu_plus2 == ftq_ptr_t(8, true, 2));
   EXPECT_TRUE(p.pf == ftq_ptr_t(8, true, 0));
   EXPECT_TRUE(p.pf_plus1 == ftq_ptr_t(8, true, 1));
   EXPECT_TRUE(p.ifu_wb == ftq_ptr_t(8, true, 0));
   // Commit is not rolled back.
   EXPECT_TRUE(p.comm == ftq_ptr_t(8, false, 6));
}

TEST(FtqPtrSet, SelfRedirectOnlyPullsBackCursorsThatPassedTheSlot) {
   ftq_ptr_set_t last(8);
   last.bpu = ftq_ptr_t(8, false, 5);
   last.ifu = ftq_ptr_t(8, false, 4);
   last.ifu_plus1 = last.ifu + 1;
   last.ifu_plus2 = last.ifu + 2;
   last.pf = ftq_ptr_t(8, false, 2);
   last.pf_plus1 = last.pf + 1;

   ftq_ptr_set_t p = last;
   p.self_redirect(ftq_ptr_t(8, false, 3), last);
   EXPECT_EQ(4u, p.bpu.value);
   EXPECT_EQ(3u, p.ifu.value);
   EXPECT_EQ(4u, p.ifu_plus1.value);
   EXPECT_EQ(5u, p.ifu_plus2.value);
   EXPECT_EQ(2u, p.pf.value);
   EXPECT_EQ(3u, p.pf_plus1.value);
}
