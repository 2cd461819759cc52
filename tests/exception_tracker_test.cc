#include <gtest/gtest.h>

#include "exception_tracker.h"

static ftq_redirect_t fault_redirect(bool pf, bool gpf, bool af) {
   ftq_redirect_t r = ftq_redirect_t();
   r.valid = true;
   r.ftq_idx = ftq_ptr_t(8, false, 2);
   r.backend_ipf = pf;
   r.backend_igpf = gpf;
   r.backend_iaf = af;
   return(r);
}

TEST(ExceptionTracker, PriorityIsPageFaultThenGuestThenAccess) {
   EXPECT_EQ(EX_PF, exception_from_flags(true, true, true));
   EXPECT_EQ(EX_GPF, exception_from_flags(false, true, true));
   EXPECT_EQ(EX_AF, exception_from_flags(false, false, true));
   EXPECT_EQ(EX_NONE, exception_from_flags(false, false, false));
}

TEST(ExceptionTracker, HeldAgainstTheRefetchedSlot) {
   exception_tracker_t t(8);
   ftq_ptr_t wb(8, false, 5);
   ftq_ptr_t wb_after(8, false, 3);

   t.update(fault_redirect(false, true, false), wb, wb_after);
   EXPECT_TRUE(t.has_exception());
   EXPECT_TRUE(t.fetch_flag(wb_after));
   EXPECT_FALSE(t.fetch_flag(wb_after + 1));
   EXPECT_EQ(EX_GPF, t.prefetch_exception(wb_after));
   EXPECT_EQ(EX_NONE, t.prefetch_exception(wb));

   // Still waiting for the faulting slot to be written back.
   t.update(ftq_redirect_t(), wb_after, wb_after);
   EXPECT_TRUE(t.has_exception());

   // Writeback moved past it.
   t.update(ftq_redirect_t(), wb_after + 1, wb_after + 1);
   EXPECT_FALSE(t.has_exception());
   EXPECT_FALSE(t.fetch_flag(wb_after));
}

TEST(ExceptionTracker, RedirectWithoutFaultClearsIt) {
   exception_tracker_t t(8);
   ftq_ptr_t p(8, false, 3);
   t.update(fault_redirect(true, false, false), p, p);
   EXPECT_EQ(EX_PF, t.exception);
   t.update(fault_redirect(false, false, false), p, p);
   EXPECT_FALSE(t.has_exception());
}
