#ifndef IFU_H
#define IFU_H
#include <cinttypes>
#include <cstdio>
#include <vector>

#include "ftq_io.h"
#include "trace.h"

// One fetched instruction on its way to the backend.
typedef
struct {
	uint64_t pc;
	uint64_t bits;
	pre_decode_info_t pd;
	ftq_ptr_t ftq_idx;
	uint64_t ftq_offset;
} fetched_insn_t;

typedef
struct {
	bool valid;
	fetch_request_t req;
} ifu_stage_t;

// Predecode faults, by kind.
typedef
struct {
	uint64_t jal_not_taken;
	uint64_t ret_not_taken;
	uint64_t not_cfi_taken;
	uint64_t invalid_taken;
	uint64_t target_fault;
} ifu_faults_t;


// Fetch model: a request waits one cycle in f1 and is predecoded and written back from f2.
class ifu_t {
private:
	uint64_t predict_width;
	const trace_t &mem;
	FILE *log;

	ifu_stage_t f1, f2;

	// Upper half of a 4-byte instruction that started in the last block.
	bool last_half_valid;
	uint64_t last_half_pc;		// start of the block it spills into

	// This cycle's writeback.
	bool wb_mispredict;
	std::vector<fetched_insn_t> fetched;

	void check_block(const fetch_request_t &req, pd_wb_t &wb);

public:
	ifu_faults_t faults;

	ifu_t(uint64_t predict_width, const trace_t &mem, FILE *log = NULL);

	// IFU -> FTQ: request ready and the writeback of the block in f2.
	void drive(ftq_in_t &in);

	// Take the next request, drop what the FTQ's flushes cover.
	void tick(const ftq_out_t &out);

	// Instructions of this cycle's writeback, in program order.
	const std::vector<fetched_insn_t> &get_fetched() const { return(fetched); }
};

#endif //IFU_H
