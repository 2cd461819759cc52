#include <cinttypes>
#include <cassert>

#include "ftq_ptr.h"

ftq_ptr_t::ftq_ptr_t() {
   size = 1;
   flag = false;
   value = 0;
}

ftq_ptr_t::ftq_ptr_t(uint64_t size, bool flag, uint64_t value) {
   this->size = ((size > 0) ? size : 1);
   this->flag = flag;
   this->value = value;
   assert(this->value < this->size);
}

ftq_ptr_t ftq_ptr_t::operator+(uint64_t n) const {
   uint64_t total = value + (n % (2 * size));
   ftq_ptr_t ptr(size, flag, 0);
   while (total >= size) {
      total -= size;
      ptr.flag = !ptr.flag;
   }
   ptr.value = total;
   return(ptr);
}

ftq_ptr_t ftq_ptr_t::operator-(uint64_t n) const {
   // Subtracting n is adding the complement modulo the 2*size flag/value space.
   return(*this + ((2 * size) - (n % (2 * size))));
}

bool ftq_ptr_t::operator==(const ftq_ptr_t &that) const {
   assert(size == that.size);
   return((flag == that.flag) && (value == that.value));
}

bool ftq_ptr_t::operator!=(const ftq_ptr_t &that) const {
   return(!(*this == that));
}

bool is_after(const ftq_ptr_t &left, const ftq_ptr_t &right) {
   assert(left.size == right.size);
   bool different_flag = (left.flag != right.flag);
   bool compare = (left.value > right.value);
   return(different_flag != compare);
}

bool is_before(const ftq_ptr_t &left, const ftq_ptr_t &right) {
   assert(left.size == right.size);
   bool different_flag = (left.flag != right.flag);
   bool compare = (left.value < right.value);
   return(different_flag != compare);
}

uint64_t distance_between(const ftq_ptr_t &enq, const ftq_ptr_t &deq) {
   assert(enq.size == deq.size);
   if (enq.flag == deq.flag)
      return(enq.value - deq.value);
   else
      return(enq.size + enq.value - deq.value);
}

bool is_full(const ftq_ptr_t &enq, const ftq_ptr_t &deq) {
   assert(enq.size == deq.size);
   return((enq.flag != deq.flag) && (enq.value == deq.value));
}

bool is_empty(const ftq_ptr_t &enq, const ftq_ptr_t &deq) {
   return(enq == deq);
}


ftq_ptr_set_t::ftq_ptr_set_t() {
}

ftq_ptr_set_t::ftq_ptr_set_t(uint64_t size) {
   ftq_ptr_t zero(size);
   bpu = zero;
   ifu = zero;
   ifu_plus1 = zero + 1;
   ifu_plus2 = zero + 2;
   pf = zero;
   pf_plus1 = zero + 1;
   ifu_wb = zero;
   comm = zero;
   comm_plus1 = zero + 1;
   rob_comm = zero;
}

void ftq_ptr_set_t::rollback(const ftq_ptr_t &idx) {
   bpu = idx + 1;
   ifu = idx + 1;
   ifu_plus1 = idx + 2;
   ifu_plus2 = idx + 3;
   pf = idx + 1;
   pf_plus1 = idx + 2;
   ifu_wb = idx + 1;
}

void ftq_ptr_set_t::self_redirect(const ftq_ptr_t &idx, const ftq_ptr_set_t &last) {
   bpu = idx + 1;

   // Only when a dispatch cursor has run ahead of the rewritten slot does it need to come back.
   if (!is_before(last.ifu, idx)) {
      ifu = idx;
      ifu_plus1 = idx + 1;
      ifu_plus2 = idx + 2;
   }
   if (!is_before(last.pf, idx)) {
      pf = idx;
      pf_plus1 = idx + 1;
   }
}
