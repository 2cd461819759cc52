#ifndef FTQ_IO_H
#define FTQ_IO_H
#include <cinttypes>

#include "parameters.h"
#include "ftq_ptr.h"
#include "ftq_types.h"

// Port bundles between the fetch target queue and its neighbors.
// All bundles are plain values; build them with value-initialization (e.g. "ftq_in_t in = ftq_in_t();")
// so that every field starts out zero/false.


////////////////////////////////////////////////////////////////
// Branch prediction unit -> FTQ
////////////////////////////////////////////////////////////////

// One predictor stage's view of a fetch block.
typedef
struct {
	bool valid;
	bool has_redirect;	// s2/s3: this stage overrides an earlier stage's prediction
	ftq_ptr_t ftq_idx;	// slot the prediction refers to
	uint64_t pc;		// block start
	bool hit;		// FTB hit
	cfi_index_t cfi_index;	// taken control-flow instruction, if any
	uint64_t target;	// next block start (taken target, or fall-through)
	bool fall_thru_error;	// the FTB fall-through was not usable
} bpu_stage_resp_t;

typedef
struct {
	bool valid;		// s1 prediction offered (enqueue request)
	bpu_stage_resp_t s1;
	bpu_stage_resp_t s2;
	bpu_stage_resp_t s3;

	// Last-stage payload, valid with s3.
	ftq_redirect_entry_t last_stage_spec_info;
	uint64_t last_stage_meta[FTQ_META_WORDS];
	ftb_entry_t last_stage_ftb_entry;
} bpu_resp_t;


////////////////////////////////////////////////////////////////
// IFU -> FTQ (predecode writeback)
////////////////////////////////////////////////////////////////

class pd_wb_t {
public:
	bool valid;
	uint64_t pc[MAX_PREDICT_WIDTH];
	pre_decode_info_t pd[MAX_PREDICT_WIDTH];
	ftq_ptr_t ftq_idx;
	cfi_index_t mis_offset;		// first mispredicted instruction, if the IFU found one
	cfi_index_t cfi_offset;		// first taken control-flow instruction found by predecode
	uint64_t target;		// correct next pc after the mispredicted instruction
	uint64_t jal_target;
	bool instr_range[MAX_PREDICT_WIDTH];	// offsets that belong to the block
};


////////////////////////////////////////////////////////////////
// Redirects
////////////////////////////////////////////////////////////////

typedef
struct {
	bool valid;
	ftq_ptr_t ftq_idx;
	uint64_t ftq_offset;
	redirect_level_e level;
	redirect_cause_e cause;

	// Control-flow update.
	uint64_t pc;
	pre_decode_info_t pd;
	bool pred_taken;
	uint64_t target;
	bool taken;
	bool is_mispred;

	bool backend_ipf;
	bool backend_igpf;
	bool backend_iaf;

	// Filled in by the FTQ from its tables before the redirect reaches the predictor.
	ftq_redirect_entry_t spec_info;
	bool br_hit;		// the redirecting branch was recorded in the FTB entry
	bool jr_hit;		// the redirecting jalr was recorded in the FTB entry
	bool sc_hit;		// statistical corrector disagreed at prediction time
	uint64_t shift;		// branch history shift
	bool add_into_hist;
} ftq_redirect_t;

// A redirect squashes the instruction itself.
bool flush_itself(const ftq_redirect_t &r);


////////////////////////////////////////////////////////////////
// Backend -> FTQ
////////////////////////////////////////////////////////////////

// commit_type: 0..3 normal, 4/5 fused with the next one/two instructions in the same block,
// 6/7 fused into offset 0/1 of the next block.
typedef
struct {
	bool valid;
	ftq_ptr_t ftq_idx;
	uint64_t ftq_offset;
	uint64_t commit_type;
} rob_commit_t;

typedef
struct {
	rob_commit_t rob_commits[MAX_COMMIT_WIDTH];
	ftq_redirect_t redirect;

	// Lookahead: candidate slots one cycle before the redirect itself.
	bool ftq_idx_ahead_valid[REDIRECT_AHEAD_NUM];
	ftq_ptr_t ftq_idx_ahead[REDIRECT_AHEAD_NUM];
	uint64_t ftq_idx_sel_oh;	// one-hot pick among the candidates, valid with the redirect
} backend_to_ftq_t;


typedef
struct {
	bpu_resp_t bpu;
	pd_wb_t pd_wb;
	backend_to_ftq_t backend;
	bool ifu_req_ready;
	bool pf_req_ready;
	bool mmio_valid;		// IFU asks whether "mmio_ptr" is the last committed slot
	ftq_ptr_t mmio_ptr;
} ftq_in_t;


////////////////////////////////////////////////////////////////
// FTQ -> IFU / prefetch
////////////////////////////////////////////////////////////////

typedef
struct {
	bool valid;
	uint64_t start_addr;
	uint64_t next_line_addr;
	uint64_t next_start_addr;
	ftq_ptr_t ftq_idx;
	cfi_index_t ftq_offset;
	bool backend_exception;
} fetch_request_t;

typedef
struct {
	bool valid;
	uint64_t start_addr;
	uint64_t next_line_addr;
	ftq_ptr_t ftq_idx;
	exception_type_e backend_exception;
} prefetch_request_t;

// Predictor stages that overwrote a slot this cycle.
typedef
struct {
	bool s2_valid;
	ftq_ptr_t s2;
	bool s3_valid;
	ftq_ptr_t s3;
} bpu_flush_info_t;

// "ptr" has been overwritten by the predictor: the s2/s3 slot is at or before it.
bool should_flush_by_stage(bool stage_valid, const ftq_ptr_t &stage_idx, const ftq_ptr_t &ptr);
bool should_flush_by(const bpu_flush_info_t &info, const ftq_ptr_t &ptr);


////////////////////////////////////////////////////////////////
// FTQ -> branch prediction unit (training)
////////////////////////////////////////////////////////////////

typedef
struct {
	bool valid;
	uint64_t pc;
	ftq_ptr_t ftq_idx;

	uint64_t meta[FTQ_META_WORDS];
	ftq_redirect_entry_t spec_info;
	ftb_entry_t ftb_entry;		// entry to write back into the FTB
	bool new_br_insert_pos[NUM_BR];	// one-hot slot of a newly inserted branch
	bool br_taken_mask[NUM_BR];
	bool br_committed[NUM_BR];	// branch in slot i was committed
	bool jmp_taken;
	bool mispred_mask[NUM_BR + 1];	// per branch slot, plus the jump
	bool old_entry;			// the regenerated entry equals the one predicted with
	bool pred_hit;			// hit or false hit
	bool false_hit;
	cfi_index_t cfi_idx;
	uint64_t full_target;
	bp_stage_e from_stage;
} bpu_update_t;


////////////////////////////////////////////////////////////////
// FTQ outputs
////////////////////////////////////////////////////////////////

typedef
struct {
	// To the predictor.
	bool bpu_resp_ready;
	ftq_ptr_t enq_ptr;
	ftq_redirect_t to_bpu_redirect;
	bool redirect_from_ifu;		// "to_bpu_redirect" came from predecode
	bpu_update_t update;

	// To the IFU.
	fetch_request_t to_ifu;
	bool ifu_redirect;		// backend redirect: the IFU drops everything in flight
	ftq_ptr_t ifu_redirect_idx;
	bpu_flush_info_t flush_from_bpu;

	// To the instruction prefetcher.
	prefetch_request_t to_prefetch;
	bool icache_flush;

	// To the backend.
	bool pc_mem_wen;
	uint64_t pc_mem_waddr;
	ftq_pc_entry_t pc_mem_wdata;
	bool newest_entry_en;
	uint64_t newest_entry_target;
	ftq_ptr_t newest_entry_ptr;

	// MMIO: the queried slot is the last committed one.
	bool mmio_last_commit;
} ftq_out_t;

#endif //FTQ_IO_H
