#include <cinttypes>
#include <cassert>

#include "commit_state.h"

commit_state_queue_t::commit_state_queue_t() {
   size = 0;
   predict_width = 0;
}

commit_state_queue_t::commit_state_queue_t(uint64_t size, uint64_t predict_width) {
   this->size = size;
   this->predict_width = predict_width;
   state.assign(size * predict_width, C_EMPTY);
}

commit_state_e commit_state_queue_t::get(uint64_t idx, uint64_t offset) const {
   assert((idx < size) && (offset < predict_width));
   return(state[(idx * predict_width) + offset]);
}

void commit_state_queue_t::set(uint64_t idx, uint64_t offset, commit_state_e s) {
   assert((idx < size) && (offset < predict_width));
   state[(idx * predict_width) + offset] = s;
}

void commit_state_queue_t::reset(uint64_t idx) {
   for (uint64_t i = 0; i < predict_width; i++)
      set(idx, i, C_EMPTY);
}

void commit_state_queue_t::flush(uint64_t idx, uint64_t offset, bool flush_itself) {
   for (uint64_t i = 0; i < predict_width; i++) {
      if (i > offset)
         set(idx, i, C_EMPTY);
      else if ((i == offset) && flush_itself)
         set(idx, i, C_FLUSHED);
   }
}

void commit_state_queue_t::commit(const ftq_ptr_t &idx, uint64_t offset, uint64_t commit_type) {
   assert(offset < predict_width);
   set(idx.value, offset, C_COMMITTED);

   switch (commit_type) {
      case 4:
         set(idx.value, (offset + 1) % predict_width, C_COMMITTED);
         break;
      case 5:
         set(idx.value, (offset + 2) % predict_width, C_COMMITTED);
         break;
      case 6:
         set((idx + 1).value, 0, C_COMMITTED);
         break;
      case 7:
         set((idx + 1).value, 1, C_COMMITTED);
         break;
      default:
         break;
   }
}

bool commit_state_queue_t::any_valid(uint64_t idx) const {
   for (uint64_t i = 0; i < predict_width; i++) {
      if ((get(idx, i) == C_TO_COMMIT) || (get(idx, i) == C_COMMITTED))
         return(true);
   }
   return(false);
}

commit_state_e commit_state_queue_t::last_valid_state(uint64_t idx) const {
   for (uint64_t i = predict_width; i > 0; i--) {
      commit_state_e s = get(idx, i - 1);
      if ((s == C_TO_COMMIT) || (s == C_COMMITTED))
         return(s);
   }
   return(C_EMPTY);
}

// The block was squashed from its first instruction (which may be the second slot of a straddling one).
bool commit_state_queue_t::first_flushed(uint64_t idx) const {
   return((get(idx, 0) == C_FLUSHED) ||
          ((get(idx, 0) == C_EMPTY) && (predict_width > 1) && (get(idx, 1) == C_FLUSHED)));
}

bool commit_state_queue_t::last_committed(uint64_t idx) const {
   return(any_valid(idx) && (last_valid_state(idx) == C_COMMITTED));
}
