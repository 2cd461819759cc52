#include <gtest/gtest.h>

#include "ftq_bench.h"
#include "commit_state.h"
#include "sync_table.h"

// Broken handshakes from a neighbor stop the model on the spot.
class FtqDeathTest : public ::testing::Test {
protected:
   FtqDeathTest() {
      ::testing::FLAGS_gtest_death_test_style = "threadsafe";
   }
};

TEST_F(FtqDeathTest, WritebackOfAnUndispatchedSlot) {
   ftq_bench_t b(8, 16);
   b.predict(0x1000, 0x1020);
   b.step();
   b.writeback(3, 0x1060, 16);
   EXPECT_DEATH(b.step(), "");
}

TEST_F(FtqDeathTest, FetchFaultForAnUnfetchedSlot) {
   ftq_bench_t b(8, 16);
   b.predict(0x1000, 0x1020);
   b.in.ifu_req_ready = false;
   b.step();
   b.predict(0x1020, 0x1040);
   b.in.ifu_req_ready = false;
   b.step();
   b.lookahead(1);
   b.in.ifu_req_ready = false;
   b.step();
   ASSERT_EQ(0u, b.ftq.cur.ptr.ifu.value);

   b.backend_redirect(1, 0, FLUSH_ITSELF, 0x1020, false);
   b.in.backend.redirect.backend_ipf = true;
   b.in.backend.ftq_idx_sel_oh = 1;
   EXPECT_DEATH(b.step(), "");
}

TEST_F(FtqDeathTest, QueueTooSmall) {
   EXPECT_DEATH(ftq_t(2, 16), "");
}

TEST_F(FtqDeathTest, PredictWidthNotAPowerOfTwo) {
   EXPECT_DEATH(ftq_t(8, 6), "");
}

TEST_F(FtqDeathTest, TwoWritesInOneCycle) {
   sync_table_t<int> t(4, 1);
   t.write(0, 1);
   EXPECT_DEATH(t.write(1, 2), "");
}

TEST_F(FtqDeathTest, PointersOfDifferentQueues) {
   ftq_ptr_t a(8, false, 1);
   ftq_ptr_t b(16, false, 1);
   EXPECT_DEATH(is_after(a, b), "");
}

TEST_F(FtqDeathTest, OffsetPastThePredictWidth) {
   commit_state_queue_t q(4, 8);
   EXPECT_DEATH(q.get(0, 8), "");
}
