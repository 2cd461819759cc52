#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "ftq.h"
#include "debug.h"

// Backend redirect.
//
// With lookahead, the backend names candidate slots one cycle before the redirect itself, so the
// tables can be read in time and the redirect takes effect the cycle it arrives.  Without
// lookahead, the redirect is registered and takes effect one cycle later.
void ftq_t::backend_redirect_in(const ftq_in_t &in) {
   const backend_to_ftq_t &be = in.backend;

   backend_redirect = be.redirect;

   bool any_ahead = false;
   for (unsigned i = 0; i < REDIRECT_AHEAD_NUM; i++)
      any_ahead = (any_ahead || be.ftq_idx_ahead_valid[i]);
   ahead_sel_oh = (be.ftq_idx_sel_oh & ((((uint64_t)1) << REDIRECT_AHEAD_NUM) - 1));

   ahead_valid = (any_ahead && !backend_redirect.valid);
   real_ahead_valid = (backend_redirect.valid && (ahead_sel_oh != 0) && cur.last_ahead_valid);
   nxt.last_ahead_valid = ahead_valid;

   nxt.backend_redirect_reg_valid = (real_ahead_valid ? false : backend_redirect.valid);
   if (backend_redirect.valid)
      nxt.backend_redirect_reg = backend_redirect;

   if (real_ahead_valid) {
      from_backend_redirect = backend_redirect;
   }
   else {
      from_backend_redirect = cur.backend_redirect_reg;
      from_backend_redirect.valid = cur.backend_redirect_reg_valid;
   }

   stage2_flush = backend_redirect.valid;
   backend_flush = (stage2_flush || cur.last_stage2_flush);
   nxt.last_stage2_flush = stage2_flush;

   // Table reads for next cycle.
   for (unsigned i = 1; i < REDIRECT_AHEAD_NUM; i++) {
      if (be.ftq_idx_ahead_valid[i]) {
         redirect_mem.read(REDIRECT_PORT_BACKEND + i, be.ftq_idx_ahead[i].value);
         meta_mem.read(META_PORT_BACKEND + i, be.ftq_idx_ahead[i].value);
         pd_mem.read(PD_PORT_BACKEND + i, be.ftq_idx_ahead[i].value);
      }
   }
   bool port0_ren = (ahead_valid ? be.ftq_idx_ahead_valid[0] : backend_redirect.valid);
   if (port0_ren) {
      uint64_t raddr = (ahead_valid ? be.ftq_idx_ahead[0].value : backend_redirect.ftq_idx.value);
      redirect_mem.read(REDIRECT_PORT_BACKEND, raddr);
      meta_mem.read(META_PORT_BACKEND, raddr);
      pd_mem.read(PD_PORT_BACKEND, raddr);
   }

   if (from_backend_redirect.valid)
      enrich_backend_redirect();

   if (any_ahead)
      stats.redirect_ahead_valid++;
}

// Fill in what the predictor needs from the tables read for the redirect.
void ftq_t::enrich_backend_redirect() {
   unsigned port = 0;
   if (real_ahead_valid) {
      for (unsigned i = 0; i < REDIRECT_AHEAD_NUM; i++) {
         if ((ahead_sel_oh >> i) & 1) {
            port = i;
            break;
         }
      }
   }

   ftq_redirect_t &r = from_backend_redirect;
   const ftq_redirect_entry_t &spec_info = redirect_mem.rdata(REDIRECT_PORT_BACKEND + port);
   const ftq_pd_entry_t &pd = pd_mem.rdata(PD_PORT_BACKEND + port);
   const ftb_entry_t &e = meta_mem.rdata(META_PORT_BACKEND + port).ftb_entry;
   uint64_t off = r.ftq_offset;
   assert(off < predict_width);

   r.spec_info = spec_info;
   r.pd = pd.to_pd(off);

   r.br_hit = e.br_is_saved(off);
   r.jr_hit = (e.is_jalr && (e.tail_slot.offset == off));
   r.sc_hit = (r.br_hit && ((e.br_slots[0].offset == off) ? spec_info.sc_disagree[0] : spec_info.sc_disagree[NUM_BR - 1]));

   bool is_br = pd_is_br(r.pd);
   if (cur.hit_status[r.ftq_idx.value] == H_HIT) {
      r.shift = e.br_count_up_to(off) + ((is_br && !e.br_is_saved(off) && !e.new_br_can_not_insert(off)) ? 1 : 0);
      r.add_into_hist = (is_br && (e.br_is_saved(off) || !e.new_br_can_not_insert(off)));
   }
   else {
      r.shift = ((is_br && r.taken) ? 1 : 0);
      r.add_into_hist = is_br;
   }
}

// Misprediction found by predecode.  It loses to anything from the backend.
void ftq_t::ifu_redirect_in(const ftq_in_t &in) {
   const pd_wb_t &wb = in.pd_wb;

   from_ifu_redirect = ftq_redirect_t();
   from_ifu_redirect.ftq_idx = ftq_ptr_t(size);
   from_ifu_redirect.valid = (wb.valid && wb.mis_offset.valid && !backend_flush);
   if (from_ifu_redirect.valid) {
      uint64_t mis = wb.mis_offset.offset;
      assert(mis < predict_width);
      from_ifu_redirect.ftq_idx = wb.ftq_idx;
      from_ifu_redirect.ftq_offset = mis;
      from_ifu_redirect.level = FLUSH_AFTER;
      from_ifu_redirect.cause = CAUSE_CTRL;
      from_ifu_redirect.pc = wb.pc[mis];
      from_ifu_redirect.pd = wb.pd[mis];
      from_ifu_redirect.pred_taken = cur.cfi_index[wb.ftq_idx.value].valid;
      from_ifu_redirect.target = wb.target;
      from_ifu_redirect.taken = wb.cfi_offset.valid;
      from_ifu_redirect.is_mispred = true;

      redirect_mem.read(REDIRECT_PORT_IFU, wb.ftq_idx.value);
      stats.predecode_redirect++;
   }

   nxt.ifu_redirect_reg.valid = from_ifu_redirect.valid;
   if (from_ifu_redirect.valid)
      nxt.ifu_redirect_reg = from_ifu_redirect;

   // Registered one cycle, completed with the snapshot.  A return goes to the RAS top.
   ifu_redirect_to_bpu = cur.ifu_redirect_reg;
   if (ifu_redirect_to_bpu.valid) {
      ifu_redirect_to_bpu.spec_info = redirect_mem.rdata(REDIRECT_PORT_IFU);
      if (ifu_redirect_to_bpu.pd.is_ret && ifu_redirect_to_bpu.pd.valid)
         ifu_redirect_to_bpu.target = ifu_redirect_to_bpu.spec_info.ras_top_addr;
   }

   ifu_flush = (from_ifu_redirect.valid || ifu_redirect_to_bpu.valid);
}

// Keep the taken cfi of a redirected entry consistent with the redirect.
void ftq_t::update_cfi_info(const ftq_redirect_t &r, bool is_backend) {
   uint64_t idx = r.ftq_idx.value;
   const cfi_index_t &cfi = cur.cfi_index[idx];

   bool bits_wen = (r.taken && (r.ftq_offset < cfi.offset));
   bool valid_wen = (r.ftq_offset == cfi.offset);
   if (bits_wen || valid_wen)
      nxt.cfi_index[idx].valid = (bits_wen || (valid_wen && r.taken));
   else if (!r.taken && (r.ftq_offset != cfi.offset))
      nxt.cfi_index[idx].valid = false;
   if (bits_wen)
      nxt.cfi_index[idx].offset = r.ftq_offset;

   nxt.newest_target = r.target;
   nxt.newest_ptr = r.ftq_idx;

   if (is_backend)
      nxt.set_mispredict(idx, r.ftq_offset, r.is_mispred);
}

void ftq_t::redirect(const ftq_in_t &in, ftq_out_t &out) {
   if (from_backend_redirect.valid)
      update_cfi_info(from_backend_redirect, true);
   else if (ifu_redirect_to_bpu.valid)
      update_cfi_info(ifu_redirect_to_bpu, false);

   // Rollback.
   switch (arbitrate_redirect(backend_redirect, from_ifu_redirect)) {
      case REDIRECT_BACKEND:
         apply_redirect(backend_redirect, nxt.ptr, nxt.commit_state);
         out.icache_flush = true;
         if (backend_redirect.level == FLUSH_AFTER)
            stats.mispredict_redirect++;
         else
            stats.replay_redirect++;
         ifprintf(logging_on, log, "FTQ: backend redirect ptr=%lu off=%lu %s target=%lx\n",
                  backend_redirect.ftq_idx.value, backend_redirect.ftq_offset,
                  ((backend_redirect.level == FLUSH_AFTER) ? "flush-after" : "flush-itself"), backend_redirect.target);
         break;
      case REDIRECT_IFU:
         apply_redirect(from_ifu_redirect, nxt.ptr, nxt.commit_state);
         out.icache_flush = true;
         ifprintf(logging_on, log, "FTQ: predecode redirect ptr=%lu off=%lu target=%lx\n",
                  from_ifu_redirect.ftq_idx.value, from_ifu_redirect.ftq_offset, from_ifu_redirect.target);
         break;
      default:
         break;
   }

   // Fetch faults stay with the slot that is fetched again after the rollback.
   if (from_backend_redirect.valid &&
       (from_backend_redirect.backend_ipf || from_backend_redirect.backend_igpf || from_backend_redirect.backend_iaf))
      assert(!is_after(from_backend_redirect.ftq_idx, cur.ptr.ifu));
   nxt.exception.update(from_backend_redirect, cur.ptr.ifu_wb, nxt.ptr.ifu_wb);

   out.ifu_redirect = stage2_flush;
   out.ifu_redirect_idx = backend_redirect.ftq_idx;

   // Retired instructions.
   for (unsigned i = 0; i < MAX_COMMIT_WIDTH; i++) {
      const rob_commit_t &c = in.backend.rob_commits[i];
      if (c.valid)
         nxt.commit_state.commit(c.ftq_idx, c.ftq_offset, c.commit_type);
   }

   // To the predictor.
   out.redirect_from_ifu = ifu_redirect_to_bpu.valid;
   out.to_bpu_redirect = (from_backend_redirect.valid ? from_backend_redirect : ifu_redirect_to_bpu);
   if (out.to_bpu_redirect.valid)
      assert(!is_before(out.to_bpu_redirect.ftq_idx, cur.ptr.comm));
}
