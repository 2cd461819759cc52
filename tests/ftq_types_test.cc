#include <gtest/gtest.h>

#include "ftq_types.h"
#include "ftq_io.h"

TEST(FtqPcEntry, PcOfEveryOffset) {
   const uint64_t widths[] = {4, 8, 16};
   const uint64_t starts[] = {0x1000, 0x101c, 0x103c, 0x80000ffe, 0x7fffffffe};

   for (unsigned w = 0; w < 3; w++) {
      uint64_t pw = widths[w];
      for (unsigned s = 0; s < 5; s++) {
         ftq_pc_entry_t e;
         e.from_branch_prediction(starts[s], false, pw);
         for (uint64_t off = 0; off < pw; off++)
            EXPECT_EQ(starts[s] + (2 * off), e.get_pc(off, pw)) << "pw=" << pw << " start=" << std::hex << starts[s] << " off=" << off;
      }
   }
}

TEST(FtqPcEntry, NextLineAndMask) {
   ftq_pc_entry_t e;
   e.from_branch_prediction(0x101c, true, 16);
   EXPECT_EQ(0x105cu, e.next_line_addr);
   EXPECT_TRUE(e.fall_thru_error);
   EXPECT_FALSE(e.is_next_mask[1]);
   EXPECT_TRUE(e.is_next_mask[2]);
   EXPECT_FALSE(e.is_next_mask[16]);
}

class FtqPdEntryTest : public ::testing::Test {
protected:
   pd_wb_t wb;

   FtqPdEntryTest() {
      wb = pd_wb_t();
   }

   void insn(uint64_t i, br_type_e type, bool rvc) {
      wb.pd[i].valid = true;
      wb.pd[i].br_type = type;
      wb.pd[i].is_rvc = rvc;
   }
};

TEST_F(FtqPdEntryTest, SummarizesTheBlock) {
   insn(0, BR_NOT_CFI, true);
   insn(1, BR_BRANCH, false);
   insn(3, BR_JAL, true);
   wb.pd[3].is_call = true;
   insn(4, BR_JALR, true);
   wb.jal_target = 0x4000;

   ftq_pd_entry_t e;
   e.from_pd_wb(wb, 8);
   EXPECT_TRUE(e.br_mask[1]);
   EXPECT_FALSE(e.br_mask[0]);
   EXPECT_TRUE(e.rvc_mask[0]);
   EXPECT_FALSE(e.rvc_mask[1]);
   // Only the first jump is kept.
   EXPECT_TRUE(e.jmp_valid);
   EXPECT_EQ(3u, e.jmp_offset);
   EXPECT_FALSE(e.jmp_is_jalr);
   EXPECT_TRUE(e.has_jal());
   EXPECT_TRUE(e.has_call());
   EXPECT_FALSE(e.has_ret());
   EXPECT_EQ(0x4000u, e.jal_target);

   pre_decode_info_t pd = e.to_pd(3);
   EXPECT_TRUE(pd_is_jal(pd));
   EXPECT_TRUE(pd.is_call);
   EXPECT_TRUE(pd.is_rvc);
   EXPECT_TRUE(pd_is_br(e.to_pd(1)));
   EXPECT_FALSE(pd_is_cfi(e.to_pd(0)));
   // The second jump is not recorded.
   EXPECT_FALSE(pd_is_cfi(e.to_pd(4)));
}

TEST_F(FtqPdEntryTest, SlotsPastTheWidthAreIgnored) {
   insn(9, BR_JALR, false);
   wb.pd[9].is_ret = true;
   ftq_pd_entry_t e;
   e.from_pd_wb(wb, 8);
   EXPECT_FALSE(e.jmp_valid);
   EXPECT_FALSE(e.has_jalr());
}

TEST(FtqFlush, StageFlushCoversItsSlotAndYounger) {
   bpu_flush_info_t f = bpu_flush_info_t();
   f.s2 = ftq_ptr_t(8, false, 3);
   f.s3 = ftq_ptr_t(8, false, 3);
   EXPECT_FALSE(should_flush_by(f, ftq_ptr_t(8, false, 4)));

   f.s2_valid = true;
   EXPECT_TRUE(should_flush_by(f, ftq_ptr_t(8, false, 3)));
   EXPECT_TRUE(should_flush_by(f, ftq_ptr_t(8, false, 5)));
   EXPECT_FALSE(should_flush_by(f, ftq_ptr_t(8, false, 2)));
   EXPECT_TRUE(should_flush_by(f, ftq_ptr_t(8, true, 1)));
}

TEST(FtqFlush, RedirectLevel) {
   ftq_redirect_t r = ftq_redirect_t();
   r.level = FLUSH_ITSELF;
   EXPECT_FALSE(flush_itself(r));
   r.valid = true;
   EXPECT_TRUE(flush_itself(r));
   r.level = FLUSH_AFTER;
   EXPECT_FALSE(flush_itself(r));
}
