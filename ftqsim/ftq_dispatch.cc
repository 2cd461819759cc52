#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "ftq.h"
#include "debug.h"

// Fetch and prefetch requests.
//
// The descriptor of the entry at a dispatch cursor comes from the table read issued last cycle,
// or from the bypass buffer when the entry was allocated last cycle (its fetch status is not
// written yet).  A slot that an s2/s3 self-redirect or a pending redirect rewrites this cycle
// is never dispatched.
void ftq_t::dispatch(const ftq_in_t &in, ftq_out_t &out) {
   const ftq_ptr_t &ifu = cur.ptr.ifu;
   const ftq_ptr_t &pf = cur.ptr.pf;

   ////////////////////////////////////////////////////////////////
   // IFU
   ////////////////////////////////////////////////////////////////

   bool bypass = (cur.last_cycle_bpu_in && (cur.last_cycle_bpu_in_ptr == ifu));
   bool bypass_plus1 = (cur.last_cycle_bpu_in && (cur.last_cycle_bpu_in_ptr == cur.ptr.ifu_plus1));

   ftq_pc_entry_t pc_bundle;
   bool entry_is_to_send;
   uint64_t entry_next_addr;
   cfi_index_t entry_ftq_offset;

   if (bypass) {
      pc_bundle = cur.bypass_buf;
      entry_is_to_send = true;
      entry_next_addr = cur.last_cycle_bpu_target;
      entry_ftq_offset = cur.last_cycle_cfi_index;
   }
   else {
      pc_bundle = pc_mem.rdata(PC_PORT_IFU);
      entry_is_to_send = (cur.fetch_status[ifu.value] == F_TO_SEND);
      if (bypass_plus1)
         entry_next_addr = cur.bypass_buf.start_addr;
      else if (ifu == cur.newest_ptr)
         entry_next_addr = cur.newest_target;
      else
         entry_next_addr = pc_mem.rdata(PC_PORT_IFU_PLUS1).start_addr;
      entry_ftq_offset = cur.cfi_index[ifu.value];
   }

   bool ifu_req_flushed = should_flush_by(flush_from_bpu, ifu);

   fetch_request_t &req = out.to_ifu;
   req.valid = (entry_is_to_send && (ifu != cur.ptr.bpu) && allow_to_ifu && !ifu_req_flushed);
   req.start_addr = pc_bundle.start_addr;
   req.next_line_addr = pc_bundle.next_line_addr;
   req.next_start_addr = entry_next_addr;
   req.ftq_idx = ifu;
   req.ftq_offset = entry_ftq_offset;
   req.backend_exception = cur.exception.fetch_flag(ifu);

   bool ifu_fire = (req.valid && in.ifu_req_ready);

   // A hit whose fall-through is unusable cannot be trusted.
   if (pc_bundle.fall_thru_error && (cur.hit_status[ifu.value] == H_HIT) && ifu_fire &&
       !(bpu_s2_redirect && (flush_from_bpu.s2 == ifu)) &&
       !(bpu_s3_redirect && (flush_from_bpu.s3 == ifu))) {
      nxt.hit_status[ifu.value] = H_FALSE_HIT;
      stats.fall_thru_error++;
      ifprintf(logging_on, log, "FTQ: fall-through error ptr=%lu start=%lx next=%lx\n",
               ifu.value, req.start_addr, req.next_start_addr);
   }

   if (ifu_fire) {
      nxt.fetch_status[ifu.value] = F_SENT;
      nxt.ptr.ifu = cur.ptr.ifu_plus1;
      nxt.ptr.ifu_plus1 = cur.ptr.ifu_plus2;
      nxt.ptr.ifu_plus2 = cur.ptr.ifu_plus2 + 1;
      ifprintf(logging_on, log, "FTQ: to ifu ptr=%lu start=%lx next=%lx%s\n",
               ifu.value, req.start_addr, req.next_start_addr, (req.backend_exception ? " (exception)" : ""));
   }

   if (in.ifu_req_ready && !req.valid)
      stats.to_ifu_bubble++;
   if (req.valid && !in.ifu_req_ready)
      stats.to_ifu_stall++;
   if (cur.ptr.bpu == ifu)
      stats.bpu_to_ifu_bubble++;

   ////////////////////////////////////////////////////////////////
   // Prefetch
   ////////////////////////////////////////////////////////////////

   bool pf_bypass = (cur.last_cycle_bpu_in && (cur.last_cycle_bpu_in_ptr == pf));
   const ftq_pc_entry_t &pf_bundle = (pf_bypass ? cur.bypass_buf : pc_mem.rdata(PC_PORT_PF));
   bool pf_to_send = (pf_bypass || (cur.fetch_status[pf.value] == F_TO_SEND));

   prefetch_request_t &pf_req = out.to_prefetch;
   pf_req.valid = (pf_to_send && (pf != cur.ptr.bpu) && allow_to_ifu && !should_flush_by(flush_from_bpu, pf));
   pf_req.start_addr = pf_bundle.start_addr;
   pf_req.next_line_addr = pf_bundle.next_line_addr;
   pf_req.ftq_idx = pf;
   pf_req.backend_exception = cur.exception.prefetch_exception(pf);

   if (pf_req.valid && in.pf_req_ready) {
      nxt.ptr.pf = cur.ptr.pf_plus1;
      nxt.ptr.pf_plus1 = cur.ptr.pf_plus1 + 1;
   }
}
