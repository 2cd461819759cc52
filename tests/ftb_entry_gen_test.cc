#include <gtest/gtest.h>

#include "ftb_entry_gen.h"

#define PW	16
#define START	0x1000

class FtbEntryGenTest : public ::testing::Test {
protected:
   ftb_entry_gen_t gen;
   ftb_entry_gen_in_t in;
   ftb_entry_gen_out_t out;

   FtbEntryGenTest() : gen(PW) {
      in.start_addr = START;
      in.old_entry = ftb_entry_t();
      in.pd = ftq_pd_entry_t();
      in.cfi_index.valid = false;
      in.cfi_index.offset = (PW - 1);
      in.target = (START + (2 * PW));
      in.hit = false;
      for (unsigned i = 0; i < MAX_PREDICT_WIDTH; i++)
         in.mispredict_vec[i] = false;
   }

   void taken(uint64_t offset, uint64_t target) {
      in.cfi_index.valid = true;
      in.cfi_index.offset = offset;
      in.target = target;
   }

   void jump(uint64_t offset, bool jalr, bool rvc) {
      in.pd.jmp_valid = true;
      in.pd.jmp_is_jalr = jalr;
      in.pd.jmp_offset = offset;
      in.pd.rvc_mask[offset] = rvc;
   }

   // Hit entry with a branch in slot 0.
   void old_branch(uint64_t offset, uint64_t target, bool strong_bias) {
      in.hit = true;
      in.old_entry.valid = true;
      in.old_entry.br_slots[0].valid = true;
      in.old_entry.br_slots[0].offset = offset;
      in.old_entry.set_by_br_target(0, START, target);
      in.old_entry.strong_bias[0] = strong_bias;
      in.old_entry.pft_addr = 0;
      in.old_entry.carry = true;
      in.pd.br_mask[offset] = true;
   }
};

TEST_F(FtbEntryGenTest, NewEntryForATakenBranch) {
   in.pd.br_mask[3] = true;
   taken(3, 0x1100);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(out.is_init_entry);
   EXPECT_FALSE(out.is_old_entry);
   EXPECT_TRUE(e.valid);
   EXPECT_TRUE(e.br_valid(0));
   EXPECT_EQ(3u, e.br_offset(0));
   EXPECT_EQ(0x1100u, e.get_target(0, START));
   EXPECT_TRUE(e.strong_bias[0]);
   EXPECT_FALSE(e.jmp_valid());
   EXPECT_EQ((uint64_t)(START + (2 * PW)), e.get_fall_through(START, PW));
   EXPECT_TRUE(out.taken_mask[0]);
   EXPECT_FALSE(out.jmp_taken);
}

TEST_F(FtbEntryGenTest, NewEntryEndsAfterAJal) {
   jump(5, false, false);
   in.pd.jal_target = 0x2000;
   taken(5, 0x2000);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(e.jmp_valid());
   EXPECT_EQ(5u, e.tail_slot.offset);
   EXPECT_EQ(0x2000u, e.tail_slot.get_target(START));
   EXPECT_FALSE(e.is_jalr);
   EXPECT_FALSE(e.strong_bias[NUM_BR - 1]);
   EXPECT_EQ(0x100eu, e.get_fall_through(START, PW));
   EXPECT_TRUE(out.jmp_taken);
}

TEST_F(FtbEntryGenTest, NewEntryWithAJalrIsStronglyBiased) {
   jump(2, true, true);
   in.pd.jmp_is_call = true;
   taken(2, 0x5000);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(e.is_jalr);
   EXPECT_TRUE(e.is_call);
   EXPECT_TRUE(e.strong_bias[NUM_BR - 1]);
   EXPECT_EQ(0x5000u, e.tail_slot.get_target(START));
   EXPECT_EQ(0x1006u, e.get_fall_through(START, PW));
}

TEST_F(FtbEntryGenTest, FourByteJumpInTheLastSlot) {
   jump(PW - 1, false, false);
   in.pd.jal_target = 0x3000;
   taken(PW - 1, 0x3000);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(e.last_may_be_rvi_call);
   EXPECT_TRUE(e.carry);
   EXPECT_EQ((uint64_t)(START + (2 * PW)), e.get_fall_through(START, PW));
}

TEST_F(FtbEntryGenTest, RecordedBranchTakenAgainKeepsTheEntry) {
   old_branch(3, 0x1100, true);
   taken(3, 0x1100);
   gen.generate(in, out);

   EXPECT_TRUE(out.is_old_entry);
   EXPECT_FALSE(out.is_strong_bias_modified);
   EXPECT_TRUE(out.new_entry == in.old_entry);
   EXPECT_TRUE(out.taken_mask[0]);
}

TEST_F(FtbEntryGenTest, NewBranchGoesIntoTheTail) {
   old_branch(2, 0x1100, true);
   in.pd.br_mask[6] = true;
   taken(6, 0x1200);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(out.is_new_br);
   EXPECT_FALSE(out.is_br_full);
   EXPECT_FALSE(out.new_br_insert_pos[0]);
   EXPECT_TRUE(out.new_br_insert_pos[NUM_BR - 1]);
   EXPECT_TRUE(e.br_valid(0));
   EXPECT_EQ(2u, e.br_offset(0));
   EXPECT_FALSE(e.strong_bias[0]);
   EXPECT_TRUE(e.br_valid(NUM_BR - 1));
   EXPECT_EQ(6u, e.br_offset(NUM_BR - 1));
   EXPECT_EQ(0x1200u, e.get_target(NUM_BR - 1, START));
   EXPECT_TRUE(e.strong_bias[NUM_BR - 1]);
   EXPECT_TRUE(out.taken_mask[NUM_BR - 1]);
}

TEST_F(FtbEntryGenTest, NewBranchInFrontShiftsTheOldOne) {
   old_branch(6, 0x1100, true);
   in.pd.br_mask[0] = true;
   taken(0, 0x1300);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(out.new_br_insert_pos[0]);
   EXPECT_EQ(0u, e.br_offset(0));
   EXPECT_EQ(0x1300u, e.get_target(0, START));
   EXPECT_TRUE(e.br_valid(NUM_BR - 1));
   EXPECT_EQ(6u, e.br_offset(NUM_BR - 1));
   EXPECT_EQ(0x1100u, e.get_target(NUM_BR - 1, START));
}

TEST_F(FtbEntryGenTest, FullEntryEvictsTheJump) {
   old_branch(2, 0x1100, false);
   in.old_entry.tail_slot.valid = true;
   in.old_entry.tail_slot.offset = 10;
   in.old_entry.set_by_jmp_target(START, 0x4000);
   in.old_entry.pft_addr = 12;
   in.old_entry.carry = false;
   jump(10, false, false);
   in.pd.br_mask[6] = true;
   taken(6, 0x1200);
   gen.generate(in, out);

   const ftb_entry_t &e = out.new_entry;
   EXPECT_TRUE(out.is_new_br);
   EXPECT_TRUE(out.is_br_full);
   EXPECT_FALSE(e.jmp_valid());
   EXPECT_EQ(6u, e.br_offset(NUM_BR - 1));
   // The block now ends at the evicted jump.
   EXPECT_EQ((uint64_t)(START + (2 * 10)), e.get_fall_through(START, PW));
   EXPECT_FALSE(e.is_call);
   EXPECT_FALSE(e.is_jalr);
}

TEST_F(FtbEntryGenTest, JalrRetarget) {
   in.hit = true;
   in.old_entry.valid = true;
   in.old_entry.tail_slot.valid = true;
   in.old_entry.tail_slot.offset = 4;
   in.old_entry.set_by_jmp_target(START, 0x3000);
   in.old_entry.is_jalr = true;
   in.old_entry.strong_bias[NUM_BR - 1] = true;
   jump(4, true, true);
   taken(4, 0x3400);
   gen.generate(in, out);

   EXPECT_TRUE(out.is_jalr_target_modified);
   EXPECT_FALSE(out.is_old_entry);
   EXPECT_EQ(0x3400u, out.new_entry.tail_slot.get_target(START));
   EXPECT_FALSE(out.new_entry.strong_bias[NUM_BR - 1]);
   EXPECT_TRUE(out.jmp_taken);
}

TEST_F(FtbEntryGenTest, StrongBiasDecaysWhenTheBranchIsNotTaken) {
   old_branch(3, 0x1100, true);
   in.cfi_index.valid = false;
   in.cfi_index.offset = 3;
   in.mispredict_vec[3] = true;
   gen.generate(in, out);

   EXPECT_TRUE(out.is_strong_bias_modified);
   EXPECT_FALSE(out.is_old_entry);
   EXPECT_FALSE(out.new_entry.strong_bias[0]);
   EXPECT_TRUE(out.new_entry.br_valid(0));
   EXPECT_FALSE(out.taken_mask[0]);
   EXPECT_TRUE(out.mispred_mask[0]);
}

TEST_F(FtbEntryGenTest, RecordedBranchWithANewTarget) {
   old_branch(3, 0x1100, true);
   taken(3, 0x1104);
   gen.generate(in, out);

   EXPECT_TRUE(out.is_br_target_modified);
   EXPECT_FALSE(out.is_jalr_target_modified);
   EXPECT_FALSE(out.is_old_entry);
   EXPECT_EQ(0x1104u, out.new_entry.get_target(0, START));
   EXPECT_TRUE(out.new_entry.strong_bias[0]);
   EXPECT_TRUE(out.taken_mask[0]);
}
