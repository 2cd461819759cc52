#ifndef EXCEPTION_TRACKER_H
#define EXCEPTION_TRACKER_H
#include <cinttypes>

#include "ftq_ptr.h"
#include "ftq_types.h"
#include "ftq_io.h"

// Instruction fetch fault reported by a backend redirect, held against the slot it belongs to
// until predecode writeback has moved past that slot.
class exception_tracker_t {
public:
	exception_type_e exception;
	ftq_ptr_t fault_ptr;

	exception_tracker_t();
	exception_tracker_t(uint64_t size);

	// One cycle.  "ifu_wb" is this cycle's writeback cursor, "ifu_wb_write" the one for the next cycle.
	void update(const ftq_redirect_t &from_backend, const ftq_ptr_t &ifu_wb, const ftq_ptr_t &ifu_wb_write);

	bool has_exception() const;
	bool fetch_flag(const ftq_ptr_t &ifu) const;
	exception_type_e prefetch_exception(const ftq_ptr_t &pf) const;
};

exception_type_e exception_from_flags(bool pf, bool gpf, bool af);

#endif //EXCEPTION_TRACKER_H
