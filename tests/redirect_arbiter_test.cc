#include <gtest/gtest.h>

#include "redirect_arbiter.h"

static ftq_redirect_t redirect_at(uint64_t idx, uint64_t offset, redirect_level_e level) {
   ftq_redirect_t r = ftq_redirect_t();
   r.valid = true;
   r.ftq_idx = ftq_ptr_t(8, false, idx);
   r.ftq_offset = offset;
   r.level = level;
   return(r);
}

TEST(RedirectArbiter, BackendWins) {
   ftq_redirect_t none = ftq_redirect_t();
   ftq_redirect_t be = redirect_at(1, 0, FLUSH_AFTER);
   ftq_redirect_t ifu = redirect_at(3, 2, FLUSH_AFTER);
   EXPECT_EQ(REDIRECT_BACKEND, arbitrate_redirect(be, ifu));
   EXPECT_EQ(REDIRECT_IFU, arbitrate_redirect(none, ifu));
   EXPECT_EQ(REDIRECT_NONE, arbitrate_redirect(none, none));
}

TEST(RedirectArbiter, ApplyRollsBackAndSquashes) {
   ftq_ptr_set_t ptrs(8);
   ptrs.bpu = ftq_ptr_t(8, false, 6);
   ptrs.ifu = ftq_ptr_t(8, false, 5);
   commit_state_queue_t cs(8, 4);
   for (uint64_t i = 0; i < 4; i++)
      cs.set(2, i, C_TO_COMMIT);

   apply_redirect(redirect_at(2, 1, FLUSH_ITSELF), ptrs, cs);
   EXPECT_EQ(3u, ptrs.bpu.value);
   EXPECT_EQ(3u, ptrs.ifu.value);
   EXPECT_EQ(3u, ptrs.ifu_wb.value);
   EXPECT_EQ(C_TO_COMMIT, cs.get(2, 0));
   EXPECT_EQ(C_FLUSHED, cs.get(2, 1));
   EXPECT_EQ(C_EMPTY, cs.get(2, 2));
}

TEST(RedirectArbiter, FlushAfterKeepsTheInstruction) {
   ftq_ptr_set_t ptrs(8);
   commit_state_queue_t cs(8, 4);
   for (uint64_t i = 0; i < 4; i++)
      cs.set(0, i, C_TO_COMMIT);

   apply_redirect(redirect_at(0, 2, FLUSH_AFTER), ptrs, cs);
   EXPECT_EQ(C_TO_COMMIT, cs.get(0, 2));
   EXPECT_EQ(C_EMPTY, cs.get(0, 3));
   EXPECT_EQ(1u, ptrs.bpu.value);
}
