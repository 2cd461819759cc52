#ifndef COMMIT_STATE_H
#define COMMIT_STATE_H
#include <cinttypes>
#include <vector>

#include "ftq_ptr.h"
#include "ftq_types.h"

// Per-slot, per-offset commit states of the queue.
class commit_state_queue_t {
private:
	uint64_t size;
	uint64_t predict_width;
	std::vector<commit_state_e> state;	// size rows of predict_width

public:
	commit_state_queue_t();
	commit_state_queue_t(uint64_t size, uint64_t predict_width);

	commit_state_e get(uint64_t idx, uint64_t offset) const;
	void set(uint64_t idx, uint64_t offset, commit_state_e s);

	// New prediction in slot idx: every offset back to empty.
	void reset(uint64_t idx);

	// Redirect at (idx, offset): later offsets are emptied, and the offset itself is
	// flushed when the redirect squashes the instruction.
	void flush(uint64_t idx, uint64_t offset, bool flush_itself);

	// A commit event from the backend, including fused instructions.
	void commit(const ftq_ptr_t &idx, uint64_t offset, uint64_t commit_type);

	bool any_valid(uint64_t idx) const;			// some offset is to_commit or committed
	commit_state_e last_valid_state(uint64_t idx) const;	// state at the highest to_commit or committed offset
	bool first_flushed(uint64_t idx) const;
	bool last_committed(uint64_t idx) const;
};

#endif //COMMIT_STATE_H
