#include <cinttypes>
#include <cassert>

#include "ftb_entry_gen.h"

ftb_entry_gen_t::ftb_entry_gen_t(uint64_t predict_width) {
   assert((predict_width > 1) && (predict_width <= MAX_PREDICT_WIDTH));
   assert((predict_width & (predict_width - 1)) == 0);
   this->predict_width = predict_width;
   log2pw = log2_width(predict_width);
}

uint64_t ftb_entry_gen_t::get_lower(uint64_t pc) const {
   return(pc_lower(pc, predict_width));
}

void ftb_entry_gen_t::init_entry(const ftb_entry_gen_in_t &in, ftb_entry_t &e) const {
   const ftq_pd_entry_t &pd = in.pd;
   uint64_t cfi = in.cfi_index.offset;

   bool cfi_is_br = (pd.br_mask[cfi] && in.cfi_index.valid);
   bool entry_has_jmp = pd.jmp_valid;
   bool new_jmp_is_jal = (entry_has_jmp && !pd.jmp_is_jalr && in.cfi_index.valid);
   bool new_jmp_is_jalr = (entry_has_jmp && pd.jmp_is_jalr && in.cfi_index.valid);
   bool new_jmp_is_call = (entry_has_jmp && pd.jmp_is_call && in.cfi_index.valid);
   bool new_jmp_is_ret = (entry_has_jmp && pd.jmp_is_ret && in.cfi_index.valid);
   bool last_jmp_rvi = (entry_has_jmp && (pd.jmp_offset == (predict_width - 1)) && !pd.rvc_mask[predict_width - 1]);
   bool cfi_is_jalr = ((cfi == pd.jmp_offset) && new_jmp_is_jalr);

   e = ftb_entry_t();
   e.valid = true;

   if (cfi_is_br) {
      ftb_slot_t &slot = e.slot_for_br(0);
      slot.valid = true;
      slot.offset = cfi;
      slot.set_lower_stat_by_target(in.start_addr, in.target, (NUM_BR == 1));
      e.strong_bias[0] = true;
   }

   if (entry_has_jmp) {
      e.tail_slot.offset = pd.jmp_offset;
      e.tail_slot.valid = (new_jmp_is_jal || new_jmp_is_jalr);
      e.tail_slot.set_lower_stat_by_target(in.start_addr, (cfi_is_jalr ? in.target : pd.jal_target), false);
      e.strong_bias[NUM_BR - 1] = new_jmp_is_jalr;
   }

   // Fall-through: just past the jump, unless the jump is a 4-byte one in the last slot.
   uint64_t jmp_pft = get_lower(in.start_addr) + pd.jmp_offset + (pd.rvc_mask[pd.jmp_offset] ? 1 : 2);
   if (entry_has_jmp && !last_jmp_rvi) {
      e.pft_addr = (jmp_pft & (predict_width - 1));
      e.carry = ((jmp_pft >> log2pw) & 1);
   }
   else {
      e.pft_addr = get_lower(in.start_addr);
      e.carry = true;
   }

   e.is_jalr = new_jmp_is_jalr;
   e.is_call = new_jmp_is_call;
   e.is_ret = new_jmp_is_ret;
   e.last_may_be_rvi_call = ((pd.jmp_offset == (predict_width - 1)) && !pd.rvc_mask[pd.jmp_offset]);
}

void ftb_entry_gen_t::insert_new_br(const ftb_entry_gen_in_t &in, const bool insert_onehot[], bool pft_need_to_change, ftb_entry_t &e) const {
   const ftb_entry_t &oe = in.old_entry;
   uint64_t new_br_offset = in.cfi_index.offset;

   for (unsigned i = 0; i < NUM_BR; i++) {
      ftb_slot_t &slot = e.slot_for_br(i);
      if (insert_onehot[i]) {
         slot.valid = true;
         slot.offset = new_br_offset;
         slot.set_lower_stat_by_target(in.start_addr, in.target, (i == (NUM_BR - 1)));
         e.strong_bias[i] = true;
      }
      else if (new_br_offset > oe.slot_for_br(i).offset) {
         e.strong_bias[i] = false;
      }
      else if (i != 0) {
         // Shift the older slot down to make room, unless the tail can stay where it is.
         bool no_need_to_move = ((i == (NUM_BR - 1)) && !oe.br_slots[NUM_BR - 2].valid);
         if (!no_need_to_move) {
            slot.from_another_slot(oe.slot_for_br(i - 1));
            e.strong_bias[i] = oe.strong_bias[i];
         }
      }
   }

   // Table full: the last control-flow instruction is evicted, so the block now ends at
   // either the evicted one or the new branch.
   if (pft_need_to_change) {
      bool any_insert = false;
      for (unsigned i = 0; i < NUM_BR; i++)
         any_insert = (any_insert || insert_onehot[i]);
      uint64_t new_pft_offset = (any_insert ? oe.slot_for_br(NUM_BR - 1).offset : new_br_offset);
      uint64_t pft = get_lower(in.start_addr) + new_pft_offset;

      e.pft_addr = (pft & (predict_width - 1));
      e.carry = ((pft >> log2pw) & 1);
      e.last_may_be_rvi_call = false;
      e.is_call = false;
      e.is_ret = false;
      e.is_jalr = false;
   }
}

void ftb_entry_gen_t::generate(const ftb_entry_gen_in_t &in, ftb_entry_gen_out_t &out) const {
   const ftb_entry_t &oe = in.old_entry;
   const ftq_pd_entry_t &pd = in.pd;
   uint64_t cfi = in.cfi_index.offset;
   assert(cfi < predict_width);

   bool cfi_is_br = (pd.br_mask[cfi] && in.cfi_index.valid);
   bool cfi_is_jalr = ((cfi == pd.jmp_offset) && pd.jmp_valid && pd.jmp_is_jalr && in.cfi_index.valid);

   // Path 1: a taken branch the old entry does not record.
   bool br_recorded_vec[NUM_BR];
   bool br_recorded = false;
   for (unsigned i = 0; i < NUM_BR; i++) {
      br_recorded_vec[i] = oe.br_recorded(i, cfi);
      br_recorded = (br_recorded || br_recorded_vec[i]);
   }
   bool is_new_br = (cfi_is_br && !br_recorded);

   // new_br_insert_onehot[i]: the new branch goes in front of old slot i.
   bool new_br_insert_onehot[NUM_BR];
   for (unsigned i = 0; i < NUM_BR; i++) {
      const ftb_slot_t &s = oe.slot_for_br(i);
      if (i == 0) {
         new_br_insert_onehot[i] = (!s.valid || (cfi < s.offset));
      }
      else {
         const ftb_slot_t &prev = oe.slot_for_br(i - 1);
         new_br_insert_onehot[i] = (prev.valid && (cfi > prev.offset) && (!s.valid || (cfi < s.offset)));
      }
   }

   bool may_have_to_replace = oe.no_empty_slot_for_new_br();
   bool pft_need_to_change = (is_new_br && may_have_to_replace);

   ftb_entry_t old_entry_modified = oe;
   insert_new_br(in, new_br_insert_onehot, pft_need_to_change, old_entry_modified);

   // Path 2: the recorded jalr went somewhere else.
   ftb_entry_t old_entry_jmp_target_modified = oe;
   uint64_t old_target = oe.tail_slot.get_target(in.start_addr);
   bool old_tail_is_jmp = !oe.tail_slot.sharing;
   bool jalr_target_modified = (cfi_is_jalr && (old_target != in.target) && old_tail_is_jmp);
   if (jalr_target_modified) {
      old_entry_jmp_target_modified.set_by_jmp_target(in.start_addr, in.target);
      for (unsigned i = 0; i < NUM_BR; i++)
         old_entry_jmp_target_modified.strong_bias[i] = false;
   }

   // Path 3: strong bias survives only while the biased branch keeps being the taken one.
   ftb_entry_t old_entry_strong_bias = oe;
   if (br_recorded_vec[0]) {
      old_entry_strong_bias.strong_bias[0] =
         (oe.strong_bias[0] && in.cfi_index.valid && oe.br_valid(0) && (cfi == oe.br_offset(0)));
   }
   else if (br_recorded_vec[NUM_BR - 1]) {
      old_entry_strong_bias.strong_bias[0] = false;
      old_entry_strong_bias.strong_bias[NUM_BR - 1] =
         (oe.strong_bias[NUM_BR - 1] && in.cfi_index.valid && oe.br_valid(NUM_BR - 1) && (cfi == oe.br_offset(NUM_BR - 1)));
   }
   bool strong_bias_modified = false;
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (oe.strong_bias[i] && oe.br_valid(i) && !old_entry_strong_bias.strong_bias[i])
         strong_bias_modified = true;
   }

   // A recorded branch taken somewhere else keeps its slot and takes the new target.
   bool br_target_modified = false;
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (br_recorded_vec[i] && in.cfi_index.valid && (oe.get_target(i, in.start_addr) != in.target)) {
         old_entry_strong_bias.set_by_br_target(i, in.start_addr, in.target);
         br_target_modified = true;
      }
   }

   if (!in.hit)
      init_entry(in, out.new_entry);
   else if (is_new_br)
      out.new_entry = old_entry_modified;
   else if (jalr_target_modified)
      out.new_entry = old_entry_jmp_target_modified;
   else
      out.new_entry = old_entry_strong_bias;

   const ftb_entry_t &ne = out.new_entry;
   for (unsigned i = 0; i < NUM_BR; i++) {
      out.new_br_insert_pos[i] = new_br_insert_onehot[i];
      out.taken_mask[i] = ((cfi == ne.br_offset(i)) && in.cfi_index.valid && ne.br_valid(i));
      out.mispred_mask[i] = (ne.br_valid(i) && in.mispredict_vec[ne.br_offset(i)]);
   }
   out.jmp_taken = (ne.jmp_valid() && (ne.tail_slot.offset == cfi));
   out.mispred_mask[NUM_BR] = (ne.jmp_valid() && in.mispredict_vec[pd.jmp_offset]);

   out.is_init_entry = !in.hit;
   out.is_old_entry = (in.hit && !is_new_br && !jalr_target_modified && !strong_bias_modified && !br_target_modified);
   out.is_new_br = (in.hit && is_new_br);
   out.is_jalr_target_modified = (in.hit && jalr_target_modified);
   out.is_br_target_modified = (in.hit && !is_new_br && !jalr_target_modified && br_target_modified);
   out.is_strong_bias_modified = (in.hit && strong_bias_modified);
   out.is_br_full = (in.hit && is_new_br && may_have_to_replace);
}
