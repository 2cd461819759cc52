#ifndef PARAMETERS_H
#define PARAMETERS_H
#include <cinttypes>

// Compile-time limits.
#define MAX_PREDICT_WIDTH	32	// per-offset arrays are sized to this
#define MAX_COMMIT_WIDTH	8	// commit events per cycle
#define REDIRECT_AHEAD_NUM	3	// lookahead redirect candidates from the backend
#define FTQ_META_WORDS		4	// opaque predictor metadata, in 64-bit words

// Fetch target queue.
extern unsigned int FTQ_SIZE;
extern unsigned int PREDICT_WIDTH;

// Backend model.
extern unsigned int RETIRE_WIDTH;

// Branch prediction unit model.
extern unsigned int FTB_ENTRIES;
extern unsigned int FTB_ASSOC;
extern unsigned int RAS_SIZE;
extern unsigned int CBP_PC_LENGTH;
extern unsigned int CBP_BHR_LENGTH;

// Benchmark control.
extern bool logging_on;
extern int64_t logging_on_at;

extern bool use_stop_amt;
extern uint64_t stop_amt;

extern uint64_t phase_interval;

#endif //PARAMETERS_H
