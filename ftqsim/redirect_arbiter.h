#ifndef REDIRECT_ARBITER_H
#define REDIRECT_ARBITER_H
#include <cinttypes>

#include "ftq_ptr.h"
#include "ftq_io.h"
#include "commit_state.h"

typedef
enum {
   REDIRECT_NONE,
   REDIRECT_BACKEND,
   REDIRECT_IFU
} redirect_source_e;

// Backend beats predecode.  At most one redirect is applied per cycle.
redirect_source_e arbitrate_redirect(const ftq_redirect_t &backend, const ftq_redirect_t &ifu);

// Roll every producer/consumer cursor back to the slot after the redirect, and
// squash the redirected block's commit states past the redirect offset.
void apply_redirect(const ftq_redirect_t &r, ftq_ptr_set_t &ptrs, commit_state_queue_t &commit_state);

#endif //REDIRECT_ARBITER_H
