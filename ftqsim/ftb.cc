#include <cinttypes>
#include <cassert>
#include <cmath>

#include "debug.h"
#include "ftb.h"

ftb_t::ftb_t(uint64_t num_entries, uint64_t assoc) {
   this->sets = (num_entries / assoc);
   this->assoc = assoc;

   assert(assoc > 0);
   assert(IsPow2(sets));

   log2sets = (uint64_t) log2((double)sets);

   // Allocate the 2D array.
   ftb = new ftb_way_t *[sets];
   for (uint64_t s = 0; s < sets; s++) {
      ftb[s] = new ftb_way_t[assoc];
      for (uint64_t way = 0; way < assoc; way++) {
         ftb[s][way].valid = false;
         ftb[s][way].tag = 0;
         ftb[s][way].lru = way;
      }
   }
}

ftb_t::~ftb_t() {
   for (uint64_t s = 0; s < sets; s++)
      delete [] ftb[s];
   delete [] ftb;
}

// On a hit, "entry" gets the recorded entry and the way becomes most-recently-used.
bool ftb_t::lookup(uint64_t pc, ftb_entry_t &entry) {
   uint64_t set;
   uint64_t tag;
   uint64_t way;

   convert(pc, set, tag);
   if (!search(set, tag, way))
      return(false);

   entry = ftb[set][way].entry;
   update_lru(set, way);
   return(true);
}

// Write the entry for the block at "pc": in place on a hit, into the LRU way on a miss.
void ftb_t::update(uint64_t pc, const ftb_entry_t &entry) {
   uint64_t set;
   uint64_t tag;
   uint64_t way;

   convert(pc, set, tag);
   search(set, tag, way);

   ftb[set][way].valid = true;
   ftb[set][way].tag = tag;
   update_lru(set, way);

   ftb[set][way].entry = entry;
}

////////////////////////////////////
// Private utility functions.
////////////////////////////////////

// Blocks start on any 2-byte boundary: drop the low bit, then split into index and tag.
void ftb_t::convert(uint64_t pc, uint64_t &set, uint64_t &tag) {
   uint64_t ftb_pc = ((pc & VADDR_MASK) >> INST_OFFSET_BITS);
   set = (ftb_pc & (sets - 1));
   tag = (ftb_pc >> log2sets);
}

// Outputs the way of either (a) the block's entry (hit) or (b) the LRU entry (miss).
bool ftb_t::search(uint64_t set, uint64_t tag, uint64_t &way) {
   bool hit = false;
   uint64_t hit_way = assoc; // out-of-bounds
   uint64_t lru_way = assoc; // out-of-bounds
   for (uint64_t i = 0; i < assoc; i++) {
      if (ftb[set][i].valid && (ftb[set][i].tag == tag)) {
         hit = true;
         hit_way = i;
         break;
      }
      else if (ftb[set][i].lru == (assoc - 1)) {
         lru_way = i;
      }
   }

   way = (hit ? hit_way : lru_way);
   assert(way < assoc);
   return(hit);
}

void ftb_t::update_lru(uint64_t set, uint64_t way) {
   // Make "way" most-recently-used.
   for (uint64_t i = 0; i < assoc; i++) {
      if (ftb[set][i].lru < ftb[set][way].lru)
         ftb[set][i].lru++;
   }
   ftb[set][way].lru = 0;
}
