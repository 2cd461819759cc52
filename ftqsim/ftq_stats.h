#ifndef FTQ_STATS_H
#define FTQ_STATS_H
#include <cinttypes>
#include <cstdio>

#include "ftb_entry.h"

// Performance counters of the fetch target queue.  Not part of the queue's state.
class ftq_stats_t {
public:
    uint64_t cycles;
    uint64_t entries;               // sum of valid entries over all cycles

    // Predictor side.
    uint64_t bpu_to_ftq_stall;      // s1 response offered but not accepted
    uint64_t from_bpu_real_bubble;  // could accept, nothing offered
    uint64_t bpu_s2_redirect;
    uint64_t bpu_s3_redirect;

    // IFU side.
    uint64_t to_ifu_bubble;         // IFU ready, no request
    uint64_t to_ifu_stall;          // request not accepted
    uint64_t bpu_to_ifu_bubble;     // dispatch caught up with allocation
    uint64_t fall_thru_error;       // hit entries with a bad fall-through sent to the IFU

    // Redirects.
    uint64_t mispredict_redirect;   // backend, flush after
    uint64_t replay_redirect;       // backend, flush itself
    uint64_t predecode_redirect;
    uint64_t redirect_ahead_valid;

    // Commit.
    uint64_t commit_blocks;
    uint64_t commit_instr;

    // Control-flow instructions, right (r) and wrong (w), by class.
    uint64_t br_r, br_w;
    uint64_t jal_r, jal_w;
    uint64_t jalr_r, jalr_w;
    uint64_t call_r, call_w;
    uint64_t ret_r, ret_w;
    uint64_t mispredict_stage[4];   // by prediction stage 1..3

    // FTB updates.
    uint64_t ftb_hit;
    uint64_t ftb_false_hit;
    uint64_t ftb_new_entry;
    uint64_t ftb_new_entry_only_br;
    uint64_t ftb_new_entry_only_jmp;
    uint64_t ftb_new_entry_br_and_jmp;
    uint64_t ftb_old_entry;
    uint64_t ftb_modified_entry;
    uint64_t ftb_modified_entry_new_br;
    uint64_t ftb_modified_entry_jalr_target;
    uint64_t ftb_modified_entry_br_target;
    uint64_t ftb_modified_entry_br_full;
    uint64_t ftb_modified_entry_strong_bias;

    ftq_stats_t();

    void output(FILE *fp) const;
};

#endif //FTQ_STATS_H
