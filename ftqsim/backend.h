#ifndef BACKEND_H
#define BACKEND_H
#include <cinttypes>
#include <cstdio>
#include <deque>
#include <vector>

#include "ftq_io.h"
#include "trace.h"
#include "ifu.h"

typedef
enum {
   BE_EXECUTE,		// executing fetched instructions
   BE_REDIRECT,		// misprediction found: send the redirect next cycle
   BE_SENT		// redirect sent this cycle
} backend_state_e;

// Backend model: executes fetched instructions in order against the oracle and commits them
// one cycle later.  An instruction executes once its successor has been fetched, so that a
// wrong successor is caught before the instruction retires.
class backend_t {
private:
	uint64_t retire_width;
	const trace_t &oracle;
	FILE *log;

	std::deque<fetched_insn_t> ibuf;
	uint64_t oracle_idx;		// next correct-path instruction

	std::vector<rob_commit_t> to_commit;	// executed last cycle
	backend_state_e state;
	ftq_redirect_t pending;

	uint64_t committed;

	void execute(backend_to_ftq_t &be);
	void make_redirect(const fetched_insn_t &f, redirect_level_e level, uint64_t target, bool pred_taken, backend_to_ftq_t &be);

public:
	// Redirects sent, by level.
	uint64_t flush_after;
	uint64_t flush_itself;

	backend_t(uint64_t retire_width, const trace_t &oracle, FILE *log = NULL);

	// Backend -> FTQ: commits, redirect and lookahead index.
	void drive(ftq_in_t &in);

	// Accept this cycle's fetched instructions, unless they are on a path being redirected.
	void tick(const std::vector<fetched_insn_t> &fetched);

	uint64_t get_committed() const { return(committed); }
	bool done() const { return(committed == oracle.length()); }
};

#endif //BACKEND_H
