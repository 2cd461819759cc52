#include <gtest/gtest.h>

#include "ftb_entry.h"

TEST(FtbSlot, TargetWithinTheSameRegion) {
   ftb_slot_t s(BR_OFFSET_LEN, false);
   s.set_lower_stat_by_target(0x80001000, 0x80001ff0, false);
   EXPECT_EQ(TAR_FIT, s.tar_stat);
   EXPECT_EQ(0x80001ff0u, s.get_target(0x80001000));
}

TEST(FtbSlot, TargetOneRegionUp) {
   ftb_slot_t s(BR_OFFSET_LEN, false);
   s.set_lower_stat_by_target(0x80001000, 0x80002010, false);
   EXPECT_EQ(TAR_OVF, s.tar_stat);
   EXPECT_EQ(0x80002010u, s.get_target(0x80001000));
}

TEST(FtbSlot, TargetOneRegionDown) {
   ftb_slot_t s(BR_OFFSET_LEN, false);
   s.set_lower_stat_by_target(0x80002000, 0x80001ffc, false);
   EXPECT_EQ(TAR_UDF, s.tar_stat);
   EXPECT_EQ(0x80001ffcu, s.get_target(0x80002000));
}

TEST(FtbSlot, TailSlotKeepsMoreBitsForAJump) {
   ftb_entry_t e;
   e.set_by_jmp_target(0x80001000, 0x80101000);
   EXPECT_FALSE(e.tail_slot.sharing);
   EXPECT_EQ(0x80101000u, e.tail_slot.get_target(0x80001000));

   // Shared with a branch, it keeps as many bits as a branch slot.
   e.set_by_br_target(NUM_BR - 1, 0x80001000, 0x80001800);
   EXPECT_TRUE(e.tail_slot.sharing);
   EXPECT_EQ(0x80001800u, e.get_target(NUM_BR - 1, 0x80001000));
}

TEST(FtbEntry, FallThroughFromPartialAddress) {
   ftb_entry_t e;
   e.pft_addr = 5;
   e.carry = false;
   EXPECT_EQ(0x100au, e.get_fall_through(0x1000, 16));
   e.carry = true;
   EXPECT_EQ(0x102au, e.get_fall_through(0x1000, 16));
}

TEST(FtbEntry, BranchSlotQueries) {
   ftb_entry_t e;
   e.valid = true;
   e.br_slots[0].valid = true;
   e.br_slots[0].offset = 2;
   e.tail_slot.valid = true;
   e.tail_slot.offset = 9;
   e.tail_slot.sharing = true;

   EXPECT_TRUE(e.br_valid(0));
   EXPECT_TRUE(e.br_valid(NUM_BR - 1));
   EXPECT_FALSE(e.jmp_valid());
   EXPECT_TRUE(e.br_is_saved(9));
   EXPECT_FALSE(e.br_is_saved(4));
   EXPECT_EQ(0u, e.br_count_up_to(1));
   EXPECT_EQ(1u, e.br_count_up_to(4));
   EXPECT_EQ(2u, e.br_count_up_to(9));
   EXPECT_TRUE(e.no_empty_slot_for_new_br());
   EXPECT_TRUE(e.new_br_can_not_insert(12));
   EXPECT_FALSE(e.new_br_can_not_insert(5));

   // The same tail as a jump.
   e.tail_slot.sharing = false;
   EXPECT_FALSE(e.br_valid(NUM_BR - 1));
   EXPECT_TRUE(e.jmp_valid());
   EXPECT_FALSE(e.br_is_saved(9));
}

TEST(FtbEntry, EqualityIncludesInvalidSlotBits) {
   ftb_entry_t a;
   ftb_entry_t b;
   EXPECT_TRUE(a == b);
   b.br_slots[0].lower = 3;
   EXPECT_TRUE(a != b);
}

TEST(FtbEntry, LowerIsTheSlotInTheAlignedWindow) {
   EXPECT_EQ(0u, pc_lower(0x1000, 16));
   EXPECT_EQ(14u, pc_lower(0x101c, 16));
   EXPECT_EQ(3u, log2_width(8));
   EXPECT_EQ(4u, log2_width(16));
}
