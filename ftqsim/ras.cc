#include <cinttypes>
#include <cassert>
#include "ras.h"

ras_t::ras_t(uint64_t size) : stack(((size > 0) ? size : 1), 0) {
   sp = 0;
}

// Oldest entries are overwritten on overflow.
void ras_t::push(uint64_t ret_addr) {
   sp = wrap_inc(sp);
   stack[sp] = ret_addr;
}

uint64_t ras_t::pop() {
   uint64_t top = stack[sp];
   sp = wrap_dec(sp);
   return(top);
}

void ras_t::restore(uint64_t sp, uint64_t top_addr) {
   assert(sp < stack.size());
   this->sp = sp;
   stack[sp] = top_addr;
}
