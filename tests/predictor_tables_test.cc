#include <gtest/gtest.h>

#include "ftb.h"
#include "gshare.h"
#include "ras.h"

static ftb_entry_t entry_with_pft(uint64_t pft) {
   ftb_entry_t e;
   e.valid = true;
   e.pft_addr = pft;
   return(e);
}

TEST(Ftb, MissThenHit) {
   ftb_t ftb(16, 2);
   ftb_entry_t e;
   EXPECT_FALSE(ftb.lookup(0x1000, e));

   ftb.update(0x1000, entry_with_pft(3));
   ASSERT_TRUE(ftb.lookup(0x1000, e));
   EXPECT_EQ(3u, e.pft_addr);

   // In place on a hit.
   ftb.update(0x1000, entry_with_pft(5));
   ASSERT_TRUE(ftb.lookup(0x1000, e));
   EXPECT_EQ(5u, e.pft_addr);

   // Same set, different tag.
   EXPECT_FALSE(ftb.lookup(0x1010, e));
}

TEST(Ftb, EvictsTheLeastRecentlyUsedWay) {
   ftb_t ftb(4, 2);	// 2 sets
   ftb_entry_t e;
   ftb.update(0x1000, entry_with_pft(1));
   ftb.update(0x1004, entry_with_pft(2));
   ASSERT_TRUE(ftb.lookup(0x1000, e));

   ftb.update(0x1008, entry_with_pft(3));
   EXPECT_FALSE(ftb.lookup(0x1004, e));
   ASSERT_TRUE(ftb.lookup(0x1000, e));
   EXPECT_EQ(1u, e.pft_addr);
   ASSERT_TRUE(ftb.lookup(0x1008, e));
   EXPECT_EQ(3u, e.pft_addr);
}

TEST(Ftb, BlocksMayStartOnAnyHalfword) {
   ftb_t ftb(4, 2);
   ftb_entry_t e;
   ftb.update(0x1002, entry_with_pft(7));
   EXPECT_FALSE(ftb.lookup(0x1000, e));
   ASSERT_TRUE(ftb.lookup(0x1002, e));
   EXPECT_EQ(7u, e.pft_addr);
}

TEST(Gshare, IndexFoldsHistoryIntoThePc) {
   gshare_t g(4, 2);
   EXPECT_EQ(16u, g.table_size());
   EXPECT_EQ(0u, g.index(0x1000, 0));
   EXPECT_EQ(1u, g.index(0x1002, 0));
   EXPECT_EQ(5u, g.index(0x1002, 1));
}

TEST(Gshare, TwoBitCounters) {
   gshare_t g(4, 2);
   EXPECT_TRUE(g.predict(0x1002, 0));
   g.train(0x1002, 0, false);
   EXPECT_FALSE(g.predict(0x1002, 0));
   g.train(0x1002, 0, false);
   g.train(0x1002, 0, false);
   g.train(0x1002, 0, true);
   EXPECT_FALSE(g.predict(0x1002, 0));
   g.train(0x1002, 0, true);
   EXPECT_TRUE(g.predict(0x1002, 0));
   // Other histories are not touched.
   EXPECT_TRUE(g.predict(0x1002, 1));
}

TEST(Gshare, HistoryShiftsInAtTheTop) {
   gshare_t g(4, 2);
   EXPECT_EQ(2u, g.update_my_bhr(0, true));
   EXPECT_EQ(1u, g.update_my_bhr(2, false));
   g.update_bhr(true);
   g.update_bhr(true);
   EXPECT_EQ(3u, g.get_bhr());
   g.set_bhr(0);
   EXPECT_EQ(0u, g.get_bhr());
}

TEST(Ras, PushPopAndWrap) {
   ras_t r(4);
   r.push(0x100);
   r.push(0x200);
   EXPECT_EQ(0x200u, r.peek());
   EXPECT_EQ(0x200u, r.pop());
   EXPECT_EQ(0x100u, r.pop());
   EXPECT_EQ(0u, r.get_sp());
   r.pop();
   EXPECT_EQ(3u, r.get_sp());
}

TEST(Ras, RestoreBringsBackTheTop) {
   ras_t r(4);
   r.push(0x100);
   r.push(0x200);
   uint64_t sp = r.get_sp();
   uint64_t top = r.peek();

   // Wrong path: pop, then push over the entry.
   r.pop();
   r.push(0x999);
   r.pop();
   r.pop();

   r.restore(sp, top);
   EXPECT_EQ(sp, r.get_sp());
   EXPECT_EQ(0x200u, r.peek());
}
