#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "trace.h"
#include "predecode.h"

trace_t::trace_t() {
}

bool trace_t::load(FILE *fp, uint64_t &bad_line) {
   uint64_t pc;
   uint64_t bits;
   int n;

   bad_line = 0;
   while ((n = fscanf(fp, "%" SCNx64 " %" SCNx64, &pc, &bits)) == 2) {
      bad_line++;
      // Instructions are 2-byte aligned and self-consistent in length.
      if ((pc & 1) || (bits >> ((insn_length_of(bits) == 4) ? 32 : 16)))
         return(false);

      // A pc always holds the same instruction.
      std::unordered_map<uint64_t, uint64_t>::const_iterator it = image.find(pc);
      if ((it != image.end()) && (it->second != bits))
         return(false);

      append(pc, bits);
   }
   if (n != EOF) {
      bad_line++;
      return(false);
   }
   return(true);
}

void trace_t::append(uint64_t pc, uint64_t bits) {
   trace_record_t r;
   r.pc = pc;
   r.bits = bits;
   records.push_back(r);
   image[pc] = bits;
}

uint64_t trace_t::next_pc(uint64_t i) const {
   assert(i < records.size());
   if ((i + 1) < records.size())
      return(records[i + 1].pc);
   return(records[i].pc + insn_length_of(records[i].bits));
}

uint64_t trace_t::parcel(uint64_t addr) const {
   std::unordered_map<uint64_t, uint64_t>::const_iterator it = image.find(addr);
   if (it != image.end())
      return(it->second & 0xffff);

   // Upper half of a 4-byte instruction.
   it = image.find(addr - 2);
   if ((it != image.end()) && (insn_length_of(it->second) == 4))
      return((it->second >> 16) & 0xffff);

   return(PARCEL_C_NOP);
}

uint64_t trace_t::fetch(uint64_t addr) const {
   uint64_t lo = parcel(addr);
   if (insn_length_of(lo) == 2)
      return(lo);
   return(lo | (parcel(addr + 2) << 16));
}
