#include <cinttypes>
#include "gshare.h"

gshare_t::gshare_t(uint64_t pc_length, uint64_t bhr_length) {
   uint64_t size;

   // Global branch history register.
   bhr = 0;
   bhr_msb = ((((uint64_t)1) << bhr_length) >> 1);

   // Parameters for index generation.
   pc_mask = ((((uint64_t)1) << pc_length) - 1);
   if (pc_length > bhr_length) {
      bhr_shamt = (pc_length - bhr_length);
      size = (((uint64_t)1) << pc_length);
   }
   else {
      bhr_shamt = 0;
      size = (((uint64_t)1) << bhr_length);
   }

   // Initialize counters to weakly-taken.
   counters.assign(size, 2);
}

// Instructions are 2-byte aligned.
uint64_t gshare_t::index(uint64_t pc, uint64_t my_bhr) const {
   return((((pc >> 1) & pc_mask) ^ (my_bhr << bhr_shamt)) & (counters.size() - 1));
}

bool gshare_t::predict(uint64_t pc, uint64_t my_bhr) const {
   return(counters[index(pc, my_bhr)] >= 2);
}

void gshare_t::train(uint64_t pc, uint64_t my_bhr, bool taken) {
   uint8_t &ctr = counters[index(pc, my_bhr)];
   if (taken) {
      if (ctr < 3)
         ctr++;
   }
   else {
      if (ctr > 0)
         ctr--;
   }
}

void gshare_t::update_bhr(bool taken) {
   bhr = update_my_bhr(bhr, taken);
}

uint64_t gshare_t::update_my_bhr(uint64_t my_bhr, bool taken) const {
   return((my_bhr >> 1) | (taken ? bhr_msb : 0));
}
