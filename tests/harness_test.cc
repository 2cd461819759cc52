#include <gtest/gtest.h>

#include "decode.h"
#include "predecode.h"
#include "trace.h"
#include "ftq.h"
#include "bpu.h"
#include "ifu.h"
#include "backend.h"

static uint64_t enc_jal(uint64_t rd, int64_t imm) {
   uint64_t i = (uint64_t)imm;
   return((((i >> 20) & 1) << 31) | (((i >> 1) & 0x3ff) << 21) | (((i >> 11) & 1) << 20) |
          (((i >> 12) & 0xff) << 12) | (rd << 7) | OPC_JAL);
}

static uint64_t enc_branch(uint64_t rs1, uint64_t rs2, uint64_t funct3, int64_t imm) {
   uint64_t i = (uint64_t)imm;
   return((((i >> 12) & 1) << 31) | (((i >> 5) & 0x3f) << 25) | (rs2 << 20) | (rs1 << 15) |
          (funct3 << 12) | (((i >> 1) & 0xf) << 8) | (((i >> 11) & 1) << 7) | OPC_BRANCH);
}

// A counted loop, a call and its return:
//   1000: addi  a0, zero, N
//   1004: c.addi a0, -1
//   1006: bnez  a0, 1004
//   100a: jal   ra, 1020
//   100e: c.nop
//   1020: c.nop
//   1022: c.jr  ra
static void build_program(trace_t &t, unsigned iterations) {
   t.append(0x1000, 0x00000513 | (iterations << 20));
   for (unsigned i = 0; i < iterations; i++) {
      t.append(0x1004, 0x157d);
      t.append(0x1006, enc_branch(10, 0, 1, -2));
   }
   t.append(0x100a, enc_jal(1, 0x16));
   t.append(0x1020, PARCEL_C_NOP);
   t.append(0x1022, 0x8082);
   t.append(0x100e, PARCEL_C_NOP);
}

typedef
struct {
   bool finished;
   uint64_t cycles;
   uint64_t committed;
   uint64_t flush_after;
   uint64_t flush_itself;
   uint64_t predecode_redirect;
   uint64_t commit_blocks;
} run_result_t;

static run_result_t run(const trace_t &trace, uint64_t ftq_size, uint64_t predict_width, uint64_t max_cycles) {
   ftq_t ftq(ftq_size, predict_width);
   bpu_t bpu(predict_width, 64, 4, 16, 10, 8);
   ifu_t ifu(predict_width, trace);
   backend_t backend(4, trace);

   bpu.reset(trace.at(0).pc);

   uint64_t cycle = 0;
   while (!backend.done() && (cycle < max_cycles)) {
      ftq_in_t in = ftq_in_t();
      ftq_out_t out = ftq_out_t();

      bpu.drive(in.bpu);
      ifu.drive(in);
      backend.drive(in);

      ftq.step(in, out);

      bpu.tick(in.bpu, out);
      ifu.tick(out);
      backend.tick(ifu.get_fetched());
      cycle++;
   }

   run_result_t r;
   r.finished = backend.done();
   r.cycles = cycle;
   r.committed = backend.get_committed();
   r.flush_after = backend.flush_after;
   r.flush_itself = backend.flush_itself;
   r.predecode_redirect = ftq.stats.predecode_redirect;
   r.commit_blocks = ftq.stats.commit_blocks;
   return(r);
}

TEST(Harness, ProgramRetiresInOrder) {
   trace_t trace;
   build_program(trace, 5);
   ASSERT_EQ(14u, trace.length());

   run_result_t r = run(trace, 64, 16, 5000);
   EXPECT_TRUE(r.finished);
   EXPECT_EQ(trace.length(), r.committed);
   EXPECT_GT(r.commit_blocks, 0u);
   // The first trip through the loop, the call and the return all start cold.
   EXPECT_GT(r.flush_after + r.predecode_redirect, 0u);
}

TEST(Harness, SmallQueueAndNarrowBlocks) {
   trace_t trace;
   build_program(trace, 20);

   run_result_t r = run(trace, 8, 4, 20000);
   EXPECT_TRUE(r.finished);
   EXPECT_EQ(trace.length(), r.committed);
}

TEST(Harness, TrainedLoopRedirectsLessThanOncePerTrip) {
   trace_t trace;
   build_program(trace, 200);

   run_result_t r = run(trace, 64, 16, 100000);
   ASSERT_TRUE(r.finished);
   EXPECT_LT(r.flush_after, 200u);
}
