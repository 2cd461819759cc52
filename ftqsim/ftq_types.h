#ifndef FTQ_TYPES_H
#define FTQ_TYPES_H
#include <cinttypes>

#include "parameters.h"
#include "ftb_entry.h"

// Per-offset commit progress of a fetch block.
typedef
enum {
   C_EMPTY,
   C_TO_COMMIT,
   C_COMMITTED,
   C_FLUSHED
} commit_state_e;

typedef
enum {
   F_TO_SEND,
   F_SENT
} fetch_status_e;

// Outcome of the predictor's FTB lookup for an entry.
typedef
enum {
   H_NOT_HIT,
   H_FALSE_HIT,
   H_HIT
} hit_status_e;

typedef
enum {
   FLUSH_AFTER,		// keep the redirecting instruction, squash what follows it
   FLUSH_ITSELF		// squash the redirecting instruction too and refetch it
} redirect_level_e;

// Why the backend redirected.
typedef
enum {
   CAUSE_CTRL,		// control-flow misprediction
   CAUSE_MEM_VIO,	// memory ordering violation
   CAUSE_OTHER
} redirect_cause_e;

// Instruction fetch fault reported by the backend.  Priority when several are flagged: PF > GPF > AF.
typedef
enum {
   EX_NONE,
   EX_PF,
   EX_GPF,
   EX_AF
} exception_type_e;

// Predictor stage that produced an entry.
typedef
enum {
   BP_S1 = 1,
   BP_S2 = 2,
   BP_S3 = 3
} bp_stage_e;

typedef
enum {
   BR_NOT_CFI = 0,
   BR_BRANCH = 1,
   BR_JAL = 2,
   BR_JALR = 3
} br_type_e;


typedef
struct {
	bool valid;		// there is an instruction starting at this offset
	bool is_rvc;		// 2-byte instruction
	br_type_e br_type;
	bool is_call;
	bool is_ret;
} pre_decode_info_t;

bool pd_is_br(const pre_decode_info_t &pd);
bool pd_is_jal(const pre_decode_info_t &pd);
bool pd_is_jalr(const pre_decode_info_t &pd);
bool pd_is_cfi(const pre_decode_info_t &pd);


// Optional offset of the taken control-flow instruction in a block.
typedef
struct {
	bool valid;
	uint64_t offset;
} cfi_index_t;


// Fetch-block descriptor: the address table row.
class ftq_pc_entry_t {
public:
	uint64_t start_addr;
	uint64_t next_line_addr;			// start of the following cache line pair
	bool is_next_mask[MAX_PREDICT_WIDTH];		// offset i lies past the aligned block boundary
	bool fall_thru_error;

	ftq_pc_entry_t();

	void from_branch_prediction(uint64_t start, bool fall_thru_error, uint64_t predict_width);
	uint64_t get_pc(uint64_t offset, uint64_t predict_width) const;
};


class pd_wb_t;

// Predecode summary of a fetch block: the predecode table row.
class ftq_pd_entry_t {
public:
	bool br_mask[MAX_PREDICT_WIDTH];
	bool jmp_valid;			// the block holds a jal or jalr
	bool jmp_is_jalr;
	bool jmp_is_call;
	bool jmp_is_ret;
	uint64_t jmp_offset;		// first jump in the block
	uint64_t jal_target;
	bool rvc_mask[MAX_PREDICT_WIDTH];

	ftq_pd_entry_t();

	void from_pd_wb(const pd_wb_t &wb, uint64_t predict_width);
	pre_decode_info_t to_pd(uint64_t offset) const;

	bool has_jal() const;
	bool has_jalr() const;
	bool has_call() const;
	bool has_ret() const;
};


// Speculative predictor state at prediction time: the snapshot table row.
// Opaque to the queue beyond copy, except for the return address on top of the RAS.
typedef
struct {
	uint64_t hist_ptr;
	uint64_t ras_sp;
	uint64_t ras_top_addr;
	bool sc_disagree[NUM_BR];
} ftq_redirect_entry_t;


// Predictor metadata plus the FTB entry it predicted with: the metadata table row.
typedef
struct {
	uint64_t meta[FTQ_META_WORDS];
	ftb_entry_t ftb_entry;
} ftq_meta_entry_t;

#endif //FTQ_TYPES_H
