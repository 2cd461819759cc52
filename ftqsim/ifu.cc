#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "parameters.h"
#include "debug.h"
#include "decode.h"
#include "predecode.h"
#include "ifu.h"

ifu_t::ifu_t(uint64_t predict_width, const trace_t &mem, FILE *log) : mem(mem) {
   assert(predict_width <= MAX_PREDICT_WIDTH);
   this->predict_width = predict_width;
   this->log = log;

   f1.valid = false;
   f2.valid = false;
   last_half_valid = false;
   last_half_pc = 0;
   wb_mispredict = false;
   faults = ifu_faults_t();
}

void ifu_t::drive(ftq_in_t &in) {
   in.ifu_req_ready = true;
   in.pf_req_ready = true;

   wb_mispredict = false;
   fetched.clear();
   if (f2.valid)
      check_block(f2.req, in.pd_wb);
}

// Predecode the block and check the prediction it was fetched with.
// The first fault in program order wins; the block is cut after it.
void ifu_t::check_block(const fetch_request_t &req, pd_wb_t &wb) {
   uint64_t start = req.start_addr;
   predecode_t dec[MAX_PREDICT_WIDTH];

   wb.valid = true;
   wb.ftq_idx = req.ftq_idx;
   for (uint64_t i = 0; i < MAX_PREDICT_WIDTH; i++) {
      wb.pc[i] = (start + (i << INST_OFFSET_BITS));
      wb.pd[i] = pre_decode_info_t();
      wb.instr_range[i] = false;
      dec[i] = predecode_t();
   }

   // Instruction boundaries.  Slot 0 is the upper half of an instruction from the last block.
   uint64_t i = ((last_half_valid && (last_half_pc == start)) ? 1 : 0);
   while (i < predict_width) {
      dec[i] = predecode(insn_t((insn_bits_t)mem.fetch(wb.pc[i])), wb.pc[i]);
      wb.pd[i] = dec[i].pd;
      i += (dec[i].length >> INST_OFFSET_BITS);
   }

   // Predicted extent of the block: up to the taken cfi, or up to the fall-through.
   bool pred_taken = req.ftq_offset.valid;
   uint64_t taken_idx = req.ftq_offset.offset;
   uint64_t range_end = (predict_width - 1);
   if (pred_taken) {
      range_end = taken_idx;
   }
   else if (req.next_start_addr > start) {
      uint64_t slots = ((req.next_start_addr - start) >> INST_OFFSET_BITS);
      if (slots <= predict_width)
         range_end = (slots - 1);
   }
   assert(range_end < predict_width);

   bool mis = false;
   uint64_t mis_offset = 0;
   bool fixed_taken = false;
   uint64_t fixed_target = 0;

   for (i = 0; (i <= range_end) && !mis; i++) {
      const pre_decode_info_t &pd = wb.pd[i];
      bool before_taken = (!pred_taken || (i < taken_idx));

      if (pd.valid && pd_is_jal(pd) && before_taken) {
         mis = true;
         fixed_taken = true;
         fixed_target = dec[i].target;
         faults.jal_not_taken++;
      }
      else if (pd.valid && pd.is_ret && before_taken) {
         // The FTQ supplies the return address from the predictor's snapshot.
         mis = true;
         fixed_taken = true;
         fixed_target = 0;
         faults.ret_not_taken++;
      }
      else if (pred_taken && (i == taken_idx) && !pd.valid) {
         mis = true;
         fixed_target = (wb.pc[i] + 2);
         faults.invalid_taken++;
      }
      else if (pred_taken && (i == taken_idx) && !pd_is_cfi(pd)) {
         mis = true;
         fixed_target = (wb.pc[i] + dec[i].length);
         faults.not_cfi_taken++;
      }
      if (mis)
         mis_offset = i;
   }

   // Direct targets must match what was predicted.
   if (!mis && pred_taken) {
      const pre_decode_info_t &pd = wb.pd[taken_idx];
      if (pd.valid && (pd_is_br(pd) || pd_is_jal(pd)) && (dec[taken_idx].target != req.next_start_addr)) {
         mis = true;
         mis_offset = taken_idx;
         fixed_taken = true;
         fixed_target = dec[taken_idx].target;
         faults.target_fault++;
      }
   }

   if (mis)
      range_end = mis_offset;

   wb.mis_offset.valid = mis;
   wb.mis_offset.offset = mis_offset;
   wb.target = fixed_target;
   wb.cfi_offset.valid = (mis ? fixed_taken : pred_taken);
   wb.cfi_offset.offset = (mis ? mis_offset : taken_idx);
   wb.jal_target = 0;
   for (i = 0; i < predict_width; i++) {
      if (wb.pd[i].valid && pd_is_jal(wb.pd[i])) {
         wb.jal_target = dec[i].target;
         break;
      }
   }

   for (i = 0; i <= range_end; i++) {
      wb.instr_range[i] = true;
      if (wb.pd[i].valid) {
         fetched_insn_t f;
         f.pc = wb.pc[i];
         f.bits = mem.fetch(wb.pc[i]);
         f.pd = wb.pd[i];
         f.ftq_idx = req.ftq_idx;
         f.ftq_offset = i;
         fetched.push_back(f);
      }
   }

   // A 4-byte instruction at the end of a fall-through block continues into the next one.
   last_half_valid = (!mis && !wb.cfi_offset.valid && wb.pd[range_end].valid && !wb.pd[range_end].is_rvc);
   last_half_pc = (start + ((range_end + 1) << INST_OFFSET_BITS));

   wb_mispredict = mis;
   ifprintf(logging_on, log, "IFU: writeback ptr=%lu start=%lx range=%lu%s\n",
            req.ftq_idx.value, start, range_end, (mis ? " mispredict" : ""));
}

void ifu_t::tick(const ftq_out_t &out) {
   // Backend redirect: everything in flight is on the wrong path.
   if (out.ifu_redirect) {
      f1.valid = false;
      f2.valid = false;
      last_half_valid = false;
      fetched.clear();
      return;
   }

   // Own redirect: younger blocks go.  Otherwise a predictor override may cover f1.
   if (wb_mispredict) {
      f1.valid = false;
      last_half_valid = false;
   }
   else if (f1.valid && should_flush_by(out.flush_from_bpu, f1.req.ftq_idx)) {
      f1.valid = false;
   }

   f2 = f1;
   f1.valid = out.to_ifu.valid;
   if (out.to_ifu.valid)
      f1.req = out.to_ifu;
}
