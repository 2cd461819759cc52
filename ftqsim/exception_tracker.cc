#include <cinttypes>

#include "exception_tracker.h"

exception_type_e exception_from_flags(bool pf, bool gpf, bool af) {
   if (pf)
      return(EX_PF);
   else if (gpf)
      return(EX_GPF);
   else if (af)
      return(EX_AF);
   return(EX_NONE);
}

exception_tracker_t::exception_tracker_t() {
   exception = EX_NONE;
}

exception_tracker_t::exception_tracker_t(uint64_t size) {
   exception = EX_NONE;
   fault_ptr = ftq_ptr_t(size);
}

void exception_tracker_t::update(const ftq_redirect_t &from_backend, const ftq_ptr_t &ifu_wb, const ftq_ptr_t &ifu_wb_write) {
   if (from_backend.valid) {
      exception = exception_from_flags(from_backend.backend_ipf, from_backend.backend_igpf, from_backend.backend_iaf);
      // The faulting block is the one that will be fetched again right after the rollback.
      if (exception != EX_NONE)
         fault_ptr = ifu_wb_write;
   }
   else if (ifu_wb != fault_ptr) {
      exception = EX_NONE;
   }
}

bool exception_tracker_t::has_exception() const {
   return(exception != EX_NONE);
}

bool exception_tracker_t::fetch_flag(const ftq_ptr_t &ifu) const {
   return(has_exception() && (fault_ptr == ifu));
}

exception_type_e exception_tracker_t::prefetch_exception(const ftq_ptr_t &pf) const {
   return((fault_ptr == pf) ? exception : EX_NONE);
}
