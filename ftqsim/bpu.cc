#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "parameters.h"
#include "debug.h"
#include "bpu.h"

bpu_t::bpu_t(uint64_t predict_width, uint64_t ftb_entries, uint64_t ftb_assoc, uint64_t ras_size,
             uint64_t cbp_pc_length, uint64_t cbp_bhr_length, FILE *log) :
   ftb(ftb_entries, ftb_assoc),
   gshare(cbp_pc_length, cbp_bhr_length),
   ras(ras_size)
{
   this->predict_width = predict_width;
   this->log = log;

   s1 = bp_block_t();
   s2 = bp_block_t();
   s3 = bp_block_t();
   s2_pred = bp_block_t();
   s3_pred = bp_block_t();
   s1_valid = false;
   s1_pc = 0;
}

void bpu_t::reset(uint64_t pc) {
   s1_valid = true;
   s1_pc = pc;
   s2.valid = false;
   s3.valid = false;
}

// Next block start and taken cfi from the FTB entry and the per-slot directions.
void bpu_t::resolve(bp_block_t &b) const {
   uint64_t block_end = (b.pc + (predict_width << INST_OFFSET_BITS));

   b.cfi_index.valid = false;
   b.cfi_index.offset = 0;
   b.fall_thru_error = false;

   if (!b.hit) {
      b.target = block_end;
      return;
   }

   // Slots are kept in offset order.
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (b.entry.br_valid(i) && b.taken[i]) {
         b.cfi_index.valid = true;
         b.cfi_index.offset = b.entry.br_offset(i);
         b.target = b.entry.get_target(i, b.pc);
         return;
      }
   }
   if (b.entry.jmp_valid()) {
      b.cfi_index.valid = true;
      b.cfi_index.offset = b.entry.tail_slot.offset;
      b.target = b.entry.get_target(NUM_BR - 1, b.pc);
      return;
   }

   // The fall-through must lie within the block.
   uint64_t fall_through = b.entry.get_fall_through(b.pc, predict_width);
   if ((fall_through <= b.pc) || (fall_through > block_end)) {
      b.fall_thru_error = true;
      b.target = block_end;
   }
   else {
      b.target = fall_through;
   }
}

bool bpu_t::same_prediction(const bp_block_t &a, const bp_block_t &b) const {
   if (a.cfi_index.valid != b.cfi_index.valid)
      return(false);
   if (a.cfi_index.valid && (a.cfi_index.offset != b.cfi_index.offset))
      return(false);
   return(a.target == b.target);
}

void bpu_t::fill_stage(const bp_block_t &b, bool has_redirect, bpu_stage_resp_t &r) const {
   r.valid = b.valid;
   r.has_redirect = has_redirect;
   r.ftq_idx = b.ftq_idx;
   r.pc = b.pc;
   r.hit = b.hit;
   r.cfi_index = b.cfi_index;
   r.target = b.target;
   r.fall_thru_error = b.fall_thru_error;
}

void bpu_t::drive(bpu_resp_t &resp) {
   // s1
   s1.valid = s1_valid;
   if (s1_valid) {
      s1.pc = s1_pc;
      s1.ftq_idx = enq_ptr;
      s1.hit = ftb.lookup(s1_pc, s1.entry);
      if (!s1.hit)
         s1.entry = ftb_entry_t();
      for (unsigned i = 0; i < NUM_BR; i++)
         s1.taken[i] = (s1.hit && s1.entry.br_valid(i) && s1.entry.strong_bias[i]);
      resolve(s1);
   }
   resp.valid = s1_valid;
   fill_stage(s1, false, resp.s1);

   // s2
   s2_pred = s2;
   if (s2.valid) {
      s2_pred.bhr = gshare.get_bhr();
      for (unsigned i = 0; i < NUM_BR; i++) {
         if (s2.hit && s2.entry.br_valid(i) && !s2.entry.strong_bias[i])
            s2_pred.taken[i] = gshare.predict(s2.pc + (s2.entry.br_offset(i) << INST_OFFSET_BITS), s2_pred.bhr);
      }
      resolve(s2_pred);
   }
   fill_stage(s2_pred, (s2.valid && !same_prediction(s2, s2_pred)), resp.s2);

   // s3
   s3_pred = s3;
   if (s3.valid && s3.cfi_index.valid && s3.entry.jmp_valid() && s3.entry.is_ret &&
       (s3.entry.tail_slot.offset == s3.cfi_index.offset))
      s3_pred.target = ras.peek();
   fill_stage(s3_pred, (s3.valid && !same_prediction(s3, s3_pred)), resp.s3);

   if (s3.valid) {
      ftq_redirect_entry_t &spec = resp.last_stage_spec_info;
      spec.hist_ptr = s3.bhr;
      spec.ras_sp = ras.get_sp();
      spec.ras_top_addr = ras.peek();
      for (unsigned i = 0; i < NUM_BR; i++)
         spec.sc_disagree[i] = false;

      uint64_t taken_bits = 0;
      for (unsigned i = 0; i < NUM_BR; i++)
         taken_bits |= ((s3.taken[i] ? 1 : 0) << i);
      resp.last_stage_meta[0] = s3.bhr;
      resp.last_stage_meta[1] = taken_bits;
      resp.last_stage_meta[2] = (s3.hit ? 1 : 0);
      resp.last_stage_meta[3] = 0;
      resp.last_stage_ftb_entry = s3.entry;
   }
}

// Speculative history: the branches of a block up to its taken cfi.
void bpu_t::speculative_update(const bp_block_t &b) {
   if (!b.hit)
      return;
   for (unsigned i = 0; i < NUM_BR; i++) {
      if (!b.entry.br_valid(i))
         continue;
      uint64_t off = b.entry.br_offset(i);
      if (b.cfi_index.valid && (off > b.cfi_index.offset))
         break;
      gshare.update_bhr(b.cfi_index.valid && (off == b.cfi_index.offset));
   }
}

void bpu_t::restart(const ftq_redirect_t &r) {
   // History: back to the block's snapshot, then its branches up to the redirecting one.
   uint64_t bhr = r.spec_info.hist_ptr;
   for (uint64_t i = 0; i < r.shift; i++)
      bhr = gshare.update_my_bhr(bhr, (((i + 1) == r.shift) && r.add_into_hist && r.taken));
   gshare.set_bhr(bhr);

   ras.restore(r.spec_info.ras_sp, r.spec_info.ras_top_addr);
   if ((r.level == FLUSH_AFTER) && r.pd.valid) {
      if (r.pd.is_call)
         ras.push(r.pc + (r.pd.is_rvc ? 2 : 4));
      else if (r.pd.is_ret)
         ras.pop();
   }

   s1_valid = true;
   s1_pc = r.target;
   s2.valid = false;
   s3.valid = false;

   ifprintf(logging_on, log, "BPU: restart at %lx (ptr=%lu off=%lu)\n", r.target, r.ftq_idx.value, r.ftq_offset);
}

void bpu_t::train(const bpu_update_t &u) {
   if (!u.old_entry)
      ftb.update(u.pc, u.ftb_entry);

   for (unsigned i = 0; i < NUM_BR; i++) {
      if (u.ftb_entry.br_valid(i) && u.br_committed[i] && !u.ftb_entry.strong_bias[i])
         gshare.train(u.pc + (u.ftb_entry.br_offset(i) << INST_OFFSET_BITS), u.meta[0], u.br_taken_mask[i]);
   }
}

void bpu_t::tick(const bpu_resp_t &resp, const ftq_out_t &out) {
   enq_ptr = out.enq_ptr;

   if (out.update.valid)
      train(out.update);

   if (out.to_bpu_redirect.valid) {
      restart(out.to_bpu_redirect);
      return;
   }

   bool s3_redirect = resp.s3.has_redirect;
   bool s2_redirect = resp.s2.has_redirect;

   // s3 -> out: the RAS follows the final prediction.
   if (s3.valid && s3_pred.cfi_index.valid && s3_pred.entry.jmp_valid() &&
       (s3_pred.entry.tail_slot.offset == s3_pred.cfi_index.offset)) {
      if (s3_pred.entry.is_call) {
         uint64_t ret_addr = (s3_pred.pc + (s3_pred.cfi_index.offset << INST_OFFSET_BITS) + 4);
         if (!s3_pred.fall_thru_error)
            ret_addr = s3_pred.entry.get_fall_through(s3_pred.pc, predict_width);
         ras.push(ret_addr);
      }
      else if (s3_pred.entry.is_ret) {
         ras.pop();
      }
   }

   // s2 -> s3, unless s3 overrode it.
   bp_block_t next_s3 = s2_pred;
   next_s3.valid = (s2.valid && !s3_redirect);
   if (next_s3.valid)
      speculative_update(next_s3);

   // s1 -> s2: accepted by the queue and not overridden by a later stage.
   // A rollback this cycle drops the block.
   bool s1_fire = (resp.valid && out.bpu_resp_ready && !out.icache_flush && !s2_redirect && !s3_redirect);
   bp_block_t next_s2 = s1;
   next_s2.valid = s1_fire;
   next_s2.ftq_idx = out.enq_ptr;

   if (s3_redirect) {
      s1_pc = s3_pred.target;
      ifprintf(logging_on, log, "BPU: s3 override ptr=%lu target=%lx\n", s3_pred.ftq_idx.value, s3_pred.target);
   }
   else if (s2_redirect) {
      s1_pc = s2_pred.target;
      ifprintf(logging_on, log, "BPU: s2 override ptr=%lu target=%lx\n", s2_pred.ftq_idx.value, s2_pred.target);
   }
   else if (s1_fire) {
      s1_pc = s1.target;
   }

   s3 = next_s3;
   s2 = next_s2;
}
