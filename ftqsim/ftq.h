#ifndef FTQ_H
#define FTQ_H
#include <cinttypes>
#include <cstdio>
#include <vector>

#include "parameters.h"
#include "ftq_ptr.h"
#include "ftq_types.h"
#include "ftq_io.h"
#include "ftb_entry.h"
#include "ftb_entry_gen.h"
#include "sync_table.h"
#include "commit_state.h"
#include "exception_tracker.h"
#include "redirect_arbiter.h"
#include "ftq_stats.h"

// Read ports of the tables.
typedef
enum {
   PC_PORT_IFU,
   PC_PORT_IFU_PLUS1,
   PC_PORT_PF,
   PC_PORT_COMM,
   PC_PORT_COMM_PLUS1,
   PC_PORTS
} pc_mem_port_e;

typedef
enum {
   REDIRECT_PORT_IFU,
   REDIRECT_PORT_BACKEND,		// REDIRECT_AHEAD_NUM ports, the first also serves the registered redirect
   REDIRECT_PORT_COMMIT = REDIRECT_PORT_BACKEND + REDIRECT_AHEAD_NUM,
   REDIRECT_PORTS
} redirect_mem_port_e;

typedef
enum {
   META_PORT_WB,
   META_PORT_BACKEND,
   META_PORT_COMMIT = META_PORT_BACKEND + REDIRECT_AHEAD_NUM,
   META_PORTS
} meta_mem_port_e;

typedef
enum {
   PD_PORT_BACKEND,
   PD_PORT_COMMIT = PD_PORT_BACKEND + REDIRECT_AHEAD_NUM,
   PD_PORTS
} pd_mem_port_e;


// Registered state of the queue (everything but the tables).
class ftq_state_t {
public:
	ftq_ptr_set_t ptr;

	// Per slot.
	std::vector<fetch_status_e> fetch_status;
	std::vector<hit_status_e> hit_status;
	std::vector<cfi_index_t> cfi_index;
	std::vector<bp_stage_e> pred_stage;
	std::vector<bool> mispredict;		// size rows of predict_width
	commit_state_queue_t commit_state;

	// Newest allocated or redirected entry and its next block start.
	ftq_ptr_t newest_ptr;
	uint64_t newest_target;

	// Allocation of the previous cycle; per-slot bookkeeping is written one cycle late.
	bool last_cycle_bpu_in;
	ftq_ptr_t last_cycle_bpu_in_ptr;
	uint64_t last_cycle_bpu_target;
	cfi_index_t last_cycle_cfi_index;
	bp_stage_e last_cycle_bpu_in_stage;
	ftq_pc_entry_t bypass_buf;		// descriptor written by that allocation
	bool clear_mispredict;			// two cycles late
	uint64_t clear_mispredict_idx;

	// Backend redirect.
	bool last_ahead_valid;
	bool backend_redirect_reg_valid;
	ftq_redirect_t backend_redirect_reg;
	bool last_stage2_flush;

	// Predecode redirect, waiting for its snapshot read.
	ftq_redirect_t ifu_redirect_reg;

	// False-hit check of the previous writeback.
	bool hit_pd_valid;
	bool hit_pd_mispred;
	pre_decode_info_t pd_reg[MAX_PREDICT_WIDTH];
	uint64_t wb_idx_reg;

	exception_tracker_t exception;

	// Commit.
	unsigned int ftb_update_stall;		// 2-cycle cool-down after an update that allocates in the FTB
	bool do_commit;
	ftq_ptr_t do_commit_ptr;
	commit_state_e commit_row[MAX_PREDICT_WIDTH];
	cfi_index_t commit_cfi;
	bool commit_mispredict[MAX_PREDICT_WIDTH];
	hit_status_e commit_hit;
	bp_stage_e commit_stage;
	bool commit_target_is_newest;
	uint64_t commit_newest_target;

	// To backend.
	bool pc_mem_wen;
	uint64_t pc_mem_waddr;
	ftq_pc_entry_t pc_mem_wdata;
	bool newest_entry_en_d1;
	bool newest_entry_en_d2;
	ftq_ptr_t newest_entry_ptr;
	uint64_t newest_entry_target;

	bool mmio_last_commit;

	ftq_state_t();
	ftq_state_t(uint64_t size, uint64_t predict_width);

	bool get_mispredict(uint64_t idx, uint64_t offset) const;
	void set_mispredict(uint64_t idx, uint64_t offset, bool m);

private:
	uint64_t predict_width;
};


class ftq_t {
private:
	uint64_t size;
	uint64_t predict_width;
	FILE *log;

	ftb_entry_gen_t ftb_entry_gen;

	////////////////////////////////////////////////////////////////
	// Signals of the cycle being evaluated.
	////////////////////////////////////////////////////////////////

	uint64_t valid_entries;
	bool resp_ready;

	// Backend redirect.
	ftq_redirect_t backend_redirect;	// as received this cycle
	ftq_redirect_t from_backend_redirect;	// the one that takes effect
	uint64_t ahead_sel_oh;
	bool ahead_valid;
	bool real_ahead_valid;
	bool stage2_flush;
	bool backend_flush;

	// Predecode redirect.
	ftq_redirect_t from_ifu_redirect;
	ftq_redirect_t ifu_redirect_to_bpu;
	bool ifu_flush;

	bool allow_bpu_in;
	bool allow_to_ifu;

	// Enqueue.
	bool bpu_s2_redirect;
	bool bpu_s3_redirect;
	bool enq_fire;
	bool bpu_in_fire;
	bp_stage_e bpu_in_stage;
	ftq_ptr_t bpu_in_resp_ptr;
	bpu_flush_info_t flush_from_bpu;

	// Commit.
	bool can_commit;
	bool can_move_comm;

	////////////////////////////////////////////////////////////////
	// Stages, in evaluation order.  Each reads "cur" and writes "nxt".
	////////////////////////////////////////////////////////////////

	void check_invariants();
	void backend_redirect_in(const ftq_in_t &in);	// ftq_redirect.cc
	void ifu_redirect_in(const ftq_in_t &in);	// ftq_redirect.cc
	void commit_condition();			// ftq_commit.cc
	void enqueue(const ftq_in_t &in, ftq_out_t &out);	// ftq_enq.cc
	void dispatch(const ftq_in_t &in, ftq_out_t &out);	// ftq_dispatch.cc
	void bpu_self_redirect();			// ftq_enq.cc
	void writeback(const ftq_in_t &in);		// ftq_writeback.cc
	void redirect(const ftq_in_t &in, ftq_out_t &out);	// ftq_redirect.cc
	void commit(const ftq_in_t &in, ftq_out_t &out);	// ftq_commit.cc
	void to_backend(ftq_out_t &out);		// ftq_commit.cc

	void update_cfi_info(const ftq_redirect_t &r, bool is_backend);
	void enrich_backend_redirect();
	void count_commit(const ftb_entry_gen_out_t &gen, const ftq_pd_entry_t &pd);

public:
	ftq_state_t cur;
	ftq_state_t nxt;

	// Tables.
	sync_table_t<ftq_pc_entry_t> pc_mem;
	sync_table_t<ftq_redirect_entry_t> redirect_mem;
	sync_table_t<ftq_meta_entry_t> meta_mem;
	sync_table_t<ftq_pd_entry_t> pd_mem;

	ftq_stats_t stats;

	ftq_t(uint64_t size, uint64_t predict_width, FILE *log = NULL);

	// One clock cycle: evaluate against the current state, then latch the next state and the tables.
	void step(const ftq_in_t &in, ftq_out_t &out);

	uint64_t get_size() const { return(size); }
	uint64_t get_predict_width() const { return(predict_width); }
};

#endif //FTQ_H
