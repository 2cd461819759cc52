#ifndef FTQ_PTR_H
#define FTQ_PTR_H
#include <cinttypes>

// A cursor into the circular fetch target queue.
// The flag flips every time the value wraps, so two pointers that are exactly "size" apart
// compare as full rather than equal.
class ftq_ptr_t {
public:
	bool flag;
	uint64_t value;
	uint64_t size;

	ftq_ptr_t();
	ftq_ptr_t(uint64_t size, bool flag = false, uint64_t value = 0);

	ftq_ptr_t operator+(uint64_t n) const;
	ftq_ptr_t operator-(uint64_t n) const;
	bool operator==(const ftq_ptr_t &that) const;
	bool operator!=(const ftq_ptr_t &that) const;
};

// Ordering, taking the flag into account.
bool is_after(const ftq_ptr_t &left, const ftq_ptr_t &right);
bool is_before(const ftq_ptr_t &left, const ftq_ptr_t &right);

// Number of entries from deq (inclusive) to enq (exclusive).
uint64_t distance_between(const ftq_ptr_t &enq, const ftq_ptr_t &deq);
bool is_full(const ftq_ptr_t &enq, const ftq_ptr_t &deq);
bool is_empty(const ftq_ptr_t &enq, const ftq_ptr_t &deq);


// All cursors of the queue.
class ftq_ptr_set_t {
public:
	ftq_ptr_t bpu;		// allocate
	ftq_ptr_t ifu;		// fetch dispatch
	ftq_ptr_t ifu_plus1;
	ftq_ptr_t ifu_plus2;
	ftq_ptr_t pf;		// prefetch dispatch
	ftq_ptr_t pf_plus1;
	ftq_ptr_t ifu_wb;	// predecode writeback
	ftq_ptr_t comm;		// commit
	ftq_ptr_t comm_plus1;
	ftq_ptr_t rob_comm;	// furthest slot the backend has committed into

	ftq_ptr_set_t();
	ftq_ptr_set_t(uint64_t size);

	// Redirect: every producer/consumer cursor restarts right after "idx".
	void rollback(const ftq_ptr_t &idx);

	// Predictor self-redirect at "idx": allocate restarts after it, and dispatch cursors
	// that had already reached it in "last" (this cycle's registers) go back to it.
	void self_redirect(const ftq_ptr_t &idx, const ftq_ptr_set_t &last);
};

#endif //FTQ_PTR_H
