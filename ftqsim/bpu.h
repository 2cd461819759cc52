#ifndef BPU_H
#define BPU_H
#include <cinttypes>
#include <cstdio>

#include "ftq_io.h"
#include "ftb.h"
#include "gshare.h"
#include "ras.h"

// A fetch block in flight in the predictor pipeline.
typedef
struct {
	bool valid;
	ftq_ptr_t ftq_idx;		// s2, s3: slot allocated when the block left s1
	uint64_t pc;
	bool hit;
	ftb_entry_t entry;
	bool taken[NUM_BR];		// direction of each branch slot
	cfi_index_t cfi_index;
	uint64_t target;
	bool fall_thru_error;
	uint64_t bhr;			// s2, s3: history the direction lookup used
} bp_block_t;


// Three-stage predictor model closing the loop around the fetch target queue.
// s1: FTB lookup; strong-bias branches and jumps are taken.
// s2: gshare direction for the other recorded branches.
// s3: return targets from the RAS.
// A later stage that disagrees with an earlier one redirects the queue.
class bpu_t {
private:
	uint64_t predict_width;
	FILE *log;

	ftb_t ftb;
	gshare_t gshare;
	ras_t ras;

	bool s1_valid;
	uint64_t s1_pc;

	// Blocks in each stage, and what each stage predicts this cycle.
	bp_block_t s1, s2, s3;
	bp_block_t s2_pred, s3_pred;

	ftq_ptr_t enq_ptr;

	void resolve(bp_block_t &b) const;
	bool same_prediction(const bp_block_t &a, const bp_block_t &b) const;
	void fill_stage(const bp_block_t &b, bool has_redirect, bpu_stage_resp_t &r) const;

	void restart(const ftq_redirect_t &r);
	void train(const bpu_update_t &u);
	void speculative_update(const bp_block_t &b);

public:
	bpu_t(uint64_t predict_width, uint64_t ftb_entries, uint64_t ftb_assoc, uint64_t ras_size,
	      uint64_t cbp_pc_length, uint64_t cbp_bhr_length, FILE *log = NULL);

	// Start predicting at "pc".
	void reset(uint64_t pc);

	// Predictor -> FTQ, from this cycle's pipeline contents.
	void drive(bpu_resp_t &resp);

	// Consume the FTQ's answers and advance the pipeline.
	void tick(const bpu_resp_t &resp, const ftq_out_t &out);
};

#endif //BPU_H
