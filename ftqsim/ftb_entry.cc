#include <cinttypes>
#include <cassert>

#include "ftb_entry.h"

uint64_t log2_width(uint64_t predict_width) {
   uint64_t bits = 0;
   while ((((uint64_t)1) << bits) < predict_width)
      bits++;
   return(bits);
}

uint64_t pc_lower(uint64_t pc, uint64_t predict_width) {
   return((pc >> INST_OFFSET_BITS) & (predict_width - 1));
}


ftb_slot_t::ftb_slot_t() {
   valid = false;
   offset = 0;
   sharing = false;
   lower = 0;
   tar_stat = TAR_FIT;
   offset_len = BR_OFFSET_LEN;
   has_sub_offset = false;
}

ftb_slot_t::ftb_slot_t(uint64_t offset_len, bool has_sub_offset) {
   valid = false;
   offset = 0;
   sharing = false;
   lower = 0;
   tar_stat = TAR_FIT;
   this->offset_len = offset_len;
   this->has_sub_offset = has_sub_offset;
}

// Keep the low "offLen" target bits and how the remaining high bits differ from those of pc.
// A shared tail slot only keeps as many bits as a branch slot.
void ftb_slot_t::set_lower_stat_by_target(uint64_t pc, uint64_t target, bool is_share) {
   assert(!is_share || has_sub_offset);
   uint64_t off_len = (is_share ? BR_OFFSET_LEN : offset_len);

   uint64_t pc_higher = ((pc & VADDR_MASK) >> (off_len + 1));
   uint64_t target_higher = ((target & VADDR_MASK) >> (off_len + 1));

   if (target_higher > pc_higher)
      tar_stat = TAR_OVF;
   else if (target_higher < pc_higher)
      tar_stat = TAR_UDF;
   else
      tar_stat = TAR_FIT;

   lower = ((target >> 1) & ((((uint64_t)1) << off_len) - 1));
   sharing = is_share;
}

uint64_t ftb_slot_t::get_target(uint64_t pc) const {
   uint64_t off_len = ((sharing && has_sub_offset) ? BR_OFFSET_LEN : offset_len);
   uint64_t higher = ((pc & VADDR_MASK) >> (off_len + 1));

   switch (tar_stat) {
      case TAR_OVF:
         higher = higher + 1;
         break;
      case TAR_UDF:
         higher = higher - 1;
         break;
      default:
         break;
   }

   uint64_t low = (lower & ((((uint64_t)1) << off_len) - 1));
   return(((higher << (off_len + 1)) | (low << 1)) & VADDR_MASK);
}

// Move a recorded control-flow instruction from another slot into this one.
void ftb_slot_t::from_another_slot(const ftb_slot_t &that) {
   assert((offset_len > that.offset_len && has_sub_offset) || (offset_len == that.offset_len));
   offset = that.offset;
   tar_stat = that.tar_stat;
   sharing = ((offset_len > that.offset_len) && (that.offset_len == BR_OFFSET_LEN) && has_sub_offset);
   valid = that.valid;
   lower = that.lower;
}

bool ftb_slot_t::operator==(const ftb_slot_t &that) const {
   // Invalid slots still carry their bits into the table, so they are compared too.
   return((valid == that.valid) &&
          (offset == that.offset) &&
          (sharing == that.sharing) &&
          (lower == that.lower) &&
          (tar_stat == that.tar_stat) &&
          (offset_len == that.offset_len));
}

bool ftb_slot_t::operator!=(const ftb_slot_t &that) const {
   return(!(*this == that));
}


ftb_entry_t::ftb_entry_t() {
   valid = false;
   for (unsigned i = 0; i < (NUM_BR - 1); i++)
      br_slots[i] = ftb_slot_t(BR_OFFSET_LEN, false);
   tail_slot = ftb_slot_t(JMP_OFFSET_LEN, true);
   pft_addr = 0;
   carry = false;
   is_call = false;
   is_ret = false;
   is_jalr = false;
   last_may_be_rvi_call = false;
   for (unsigned i = 0; i < NUM_BR; i++)
      strong_bias[i] = false;
}

ftb_slot_t &ftb_entry_t::slot_for_br(unsigned i) {
   assert(i < NUM_BR);
   return((i == (NUM_BR - 1)) ? tail_slot : br_slots[i]);
}

const ftb_slot_t &ftb_entry_t::slot_for_br(unsigned i) const {
   assert(i < NUM_BR);
   return((i == (NUM_BR - 1)) ? tail_slot : br_slots[i]);
}

bool ftb_entry_t::br_valid(unsigned i) const {
   if (i == (NUM_BR - 1))
      return(tail_slot.valid && tail_slot.sharing);
   return(br_slots[i].valid);
}

uint64_t ftb_entry_t::br_offset(unsigned i) const {
   return(slot_for_br(i).offset);
}

bool ftb_entry_t::jmp_valid() const {
   return(tail_slot.valid && !tail_slot.sharing);
}

bool ftb_entry_t::is_jal() const {
   return(!is_jalr);
}

bool ftb_entry_t::br_recorded(unsigned i, uint64_t offset) const {
   return(br_valid(i) && (br_offset(i) == offset));
}

bool ftb_entry_t::br_is_saved(uint64_t offset) const {
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (br_recorded(i, offset))
         return(true);
   }
   return(false);
}

unsigned ftb_entry_t::br_count_up_to(uint64_t offset) const {
   unsigned count = 0;
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (br_valid(i) && (br_offset(i) <= offset))
         count++;
   }
   return(count);
}

// The last slot is taken by a control-flow instruction before "offset".
bool ftb_entry_t::new_br_can_not_insert(uint64_t offset) const {
   return(tail_slot.valid && (tail_slot.offset < offset));
}

bool ftb_entry_t::no_empty_slot_for_new_br() const {
   for (unsigned i = 0; i < (NUM_BR - 1); i++) {
      if (!br_slots[i].valid)
         return(false);
   }
   return(tail_slot.valid);
}

void ftb_entry_t::set_by_br_target(unsigned i, uint64_t pc, uint64_t target) {
   slot_for_br(i).set_lower_stat_by_target(pc, target, (i == (NUM_BR - 1)));
}

void ftb_entry_t::set_by_jmp_target(uint64_t pc, uint64_t target) {
   tail_slot.set_lower_stat_by_target(pc, target, false);
}

uint64_t ftb_entry_t::get_fall_through(uint64_t pc, uint64_t predict_width) const {
   uint64_t shamt = log2_width(predict_width) + INST_OFFSET_BITS;
   uint64_t higher = ((pc & VADDR_MASK) >> shamt);
   if (carry)
      higher++;
   return(((higher << shamt) | (pft_addr << INST_OFFSET_BITS)) & VADDR_MASK);
}

uint64_t ftb_entry_t::get_target(unsigned i, uint64_t pc) const {
   return(slot_for_br(i).get_target(pc));
}

bool ftb_entry_t::operator==(const ftb_entry_t &that) const {
   for (unsigned i = 0; i < (NUM_BR - 1); i++) {
      if (br_slots[i] != that.br_slots[i])
         return(false);
   }
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (strong_bias[i] != that.strong_bias[i])
         return(false);
   }
   return((valid == that.valid) &&
          (tail_slot == that.tail_slot) &&
          (pft_addr == that.pft_addr) &&
          (carry == that.carry) &&
          (is_call == that.is_call) &&
          (is_ret == that.is_ret) &&
          (is_jalr == that.is_jalr) &&
          (last_may_be_rvi_call == that.last_may_be_rvi_call));
}

bool ftb_entry_t::operator!=(const ftb_entry_t &that) const {
   return(!(*this == that));
}
