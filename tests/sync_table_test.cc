#include <gtest/gtest.h>

#include "sync_table.h"

TEST(SyncTable, ReadDataArrivesNextCycle) {
   sync_table_t<int> t(4, 2);
   t.write(1, 10);
   t.tick();

   t.read(0, 1);
   EXPECT_EQ(0, t.rdata(0));
   t.tick();
   EXPECT_EQ(10, t.rdata(0));
}

TEST(SyncTable, SameCycleWriteIsVisibleToTheRead) {
   sync_table_t<int> t(4, 1);
   t.write(2, 7);
   t.read(0, 2);
   t.tick();
   EXPECT_EQ(7, t.rdata(0));
   EXPECT_EQ(7, t.peek(2));
}

TEST(SyncTable, PortHoldsItsDataWhenNotRead) {
   sync_table_t<int> t(4, 2);
   t.write(0, 5);
   t.read(0, 0);
   t.tick();

   t.write(0, 6);
   t.read(1, 0);
   t.tick();
   EXPECT_EQ(5, t.rdata(0));
   EXPECT_EQ(6, t.rdata(1));
}
