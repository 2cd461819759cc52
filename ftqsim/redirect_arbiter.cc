#include <cinttypes>
#include <cassert>

#include "redirect_arbiter.h"

redirect_source_e arbitrate_redirect(const ftq_redirect_t &backend, const ftq_redirect_t &ifu) {
   if (backend.valid)
      return(REDIRECT_BACKEND);
   else if (ifu.valid)
      return(REDIRECT_IFU);
   return(REDIRECT_NONE);
}

void apply_redirect(const ftq_redirect_t &r, ftq_ptr_set_t &ptrs, commit_state_queue_t &commit_state) {
   assert(r.valid);
   ptrs.rollback(r.ftq_idx);
   commit_state.flush(r.ftq_idx.value, r.ftq_offset, flush_itself(r));
}
