#include <cinttypes>
#include "parameters.h"

// Fetch target queue.
uint32_t FTQ_SIZE	= 64;
uint32_t PREDICT_WIDTH	= 16;	// 2-byte slots: a 32-byte fetch block

// Backend model.
uint32_t RETIRE_WIDTH	= 8;

// Branch prediction unit model.
uint32_t FTB_ENTRIES	= 2048;
uint32_t FTB_ASSOC	= 4;
uint32_t RAS_SIZE	= 32;
uint32_t CBP_PC_LENGTH	= 10;
uint32_t CBP_BHR_LENGTH	= 8;

// Benchmark control.
bool logging_on		= false;
int64_t logging_on_at	= 0;	// -1: log from the start

bool use_stop_amt	= false;
uint64_t stop_amt	= 0xffffffffffffffff;

uint64_t phase_interval	= 0;	// 0: no interim stats
