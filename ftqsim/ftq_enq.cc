#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "ftq.h"
#include "debug.h"

// Accept predictor responses: allocate on s1, overwrite on an s2/s3 self-redirect.
void ftq_t::enqueue(const ftq_in_t &in, ftq_out_t &out) {
   const bpu_resp_t &bpu = in.bpu;

   out.bpu_resp_ready = resp_ready;
   out.enq_ptr = cur.ptr.bpu;

   // A self-redirect only applies to a slot still allocated, and never during a rollback.
   bpu_s2_redirect = (bpu.s2.valid && bpu.s2.has_redirect && allow_bpu_in &&
                      is_before(bpu.s2.ftq_idx, cur.ptr.bpu));
   bpu_s3_redirect = (bpu.s3.valid && bpu.s3.has_redirect && allow_bpu_in &&
                      is_before(bpu.s3.ftq_idx, cur.ptr.bpu));

   bool resp_fire = (bpu.valid && resp_ready);
   enq_fire = (resp_fire && allow_bpu_in);
   bpu_in_fire = ((resp_fire || bpu_s2_redirect || bpu_s3_redirect) && allow_bpu_in);

   // The latest stage that disagrees wins.
   const bpu_stage_resp_t *resp;
   if (bpu_s3_redirect) {
      resp = &bpu.s3;
      bpu_in_stage = BP_S3;
   }
   else if (bpu_s2_redirect) {
      resp = &bpu.s2;
      bpu_in_stage = BP_S2;
   }
   else {
      resp = &bpu.s1;
      bpu_in_stage = BP_S1;
   }
   bpu_in_resp_ptr = ((bpu_in_stage == BP_S1) ? cur.ptr.bpu : resp->ftq_idx);

   if (bpu_in_fire) {
      ftq_pc_entry_t wdata;
      wdata.from_branch_prediction(resp->pc, resp->fall_thru_error, predict_width);
      pc_mem.write(bpu_in_resp_ptr.value, wdata);

      nxt.bypass_buf = wdata;
      nxt.last_cycle_bpu_in_ptr = bpu_in_resp_ptr;
      nxt.last_cycle_bpu_target = resp->target;
      nxt.last_cycle_cfi_index = resp->cfi_index;
      // An absent cfi reads as the last offset, so that any taken offset compares below it.
      if (!resp->cfi_index.valid)
         nxt.last_cycle_cfi_index.offset = (predict_width - 1);
      assert(nxt.last_cycle_cfi_index.offset < predict_width);
      nxt.last_cycle_bpu_in_stage = bpu_in_stage;

      ifprintf(logging_on, log, "FTQ: enq s%d ptr=%c%lu start=%lx target=%lx cfi=%c%lu\n",
               (int)bpu_in_stage, (bpu_in_resp_ptr.flag ? '1' : '0'), bpu_in_resp_ptr.value,
               resp->pc, resp->target, (resp->cfi_index.valid ? 'v' : '-'), resp->cfi_index.offset);
   }
   nxt.last_cycle_bpu_in = bpu_in_fire;

   // The last stage carries the predictor snapshot and metadata.
   if (bpu.s3.valid) {
      ftq_meta_entry_t meta;
      for (unsigned i = 0; i < FTQ_META_WORDS; i++)
         meta.meta[i] = bpu.last_stage_meta[i];
      meta.ftb_entry = bpu.last_stage_ftb_entry;
      redirect_mem.write(bpu.s3.ftq_idx.value, bpu.last_stage_spec_info);
      meta_mem.write(bpu.s3.ftq_idx.value, meta);
   }

   // Per-slot bookkeeping of last cycle's allocation.
   if (cur.last_cycle_bpu_in) {
      uint64_t idx = cur.last_cycle_bpu_in_ptr.value;
      nxt.fetch_status[idx] = F_TO_SEND;
      nxt.cfi_index[idx] = cur.last_cycle_cfi_index;
      nxt.pred_stage[idx] = cur.last_cycle_bpu_in_stage;
      nxt.newest_target = cur.last_cycle_bpu_target;
      nxt.newest_ptr = cur.last_cycle_bpu_in_ptr;
      nxt.commit_state.reset(idx);
   }
   nxt.clear_mispredict = cur.last_cycle_bpu_in;
   if (cur.last_cycle_bpu_in)
      nxt.clear_mispredict_idx = cur.last_cycle_bpu_in_ptr.value;
   if (cur.clear_mispredict) {
      for (uint64_t i = 0; i < predict_width; i++)
         nxt.set_mispredict(cur.clear_mispredict_idx, i, false);
   }

   nxt.ptr.bpu = cur.ptr.bpu + (enq_fire ? 1 : 0);

   // Hit status comes from the FTB lookup, which s2 reports.
   if (bpu.s2.valid)
      nxt.hit_status[bpu.s2.ftq_idx.value] = (bpu.s2.hit ? H_HIT : H_NOT_HIT);

   flush_from_bpu.s2_valid = bpu_s2_redirect;
   flush_from_bpu.s2 = bpu.s2.ftq_idx;
   flush_from_bpu.s3_valid = bpu_s3_redirect;
   flush_from_bpu.s3 = bpu.s3.ftq_idx;
   out.flush_from_bpu = flush_from_bpu;

   if (bpu.valid && !resp_ready)
      stats.bpu_to_ftq_stall++;
   if (!bpu.valid && resp_ready && allow_bpu_in)
      stats.from_bpu_real_bubble++;
   if (bpu_s2_redirect)
      stats.bpu_s2_redirect++;
   if (bpu_s3_redirect)
      stats.bpu_s3_redirect++;
}

// s2, then s3, rewrite a slot: allocation restarts after it and dispatch returns to it.
void ftq_t::bpu_self_redirect() {
   if (bpu_s2_redirect) {
      assert(is_before(flush_from_bpu.s2, cur.ptr.bpu));
      nxt.ptr.self_redirect(flush_from_bpu.s2, cur.ptr);
      ifprintf(logging_on, log, "FTQ: s2 redirect ptr=%lu\n", flush_from_bpu.s2.value);
   }
   if (bpu_s3_redirect) {
      assert(is_before(flush_from_bpu.s3, cur.ptr.bpu));
      nxt.ptr.self_redirect(flush_from_bpu.s3, cur.ptr);
      ifprintf(logging_on, log, "FTQ: s3 redirect ptr=%lu\n", flush_from_bpu.s3.value);
   }
}
