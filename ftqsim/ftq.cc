#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "ftq.h"
#include "debug.h"

ftq_state_t::ftq_state_t() {
   predict_width = 0;
}

ftq_state_t::ftq_state_t(uint64_t size, uint64_t predict_width) :
   ptr(size),
   fetch_status(size, F_SENT),
   hit_status(size, H_NOT_HIT),
   cfi_index(size),
   pred_stage(size, BP_S1),
   mispredict(size * predict_width, false),
   commit_state(size, predict_width),
   newest_ptr(size),
   last_cycle_bpu_in_ptr(size),
   exception(size),
   do_commit_ptr(size),
   newest_entry_ptr(size)
{
   this->predict_width = predict_width;

   for (uint64_t i = 0; i < size; i++) {
      cfi_index[i].valid = false;
      cfi_index[i].offset = (predict_width - 1);
   }
   newest_target = 0;

   last_cycle_bpu_in = false;
   last_cycle_bpu_target = 0;
   last_cycle_cfi_index.valid = false;
   last_cycle_cfi_index.offset = (predict_width - 1);
   last_cycle_bpu_in_stage = BP_S1;
   clear_mispredict = false;
   clear_mispredict_idx = 0;

   last_ahead_valid = false;
   backend_redirect_reg_valid = false;
   backend_redirect_reg = ftq_redirect_t();
   backend_redirect_reg.ftq_idx = ftq_ptr_t(size);
   last_stage2_flush = false;

   ifu_redirect_reg = ftq_redirect_t();
   ifu_redirect_reg.ftq_idx = ftq_ptr_t(size);

   hit_pd_valid = false;
   hit_pd_mispred = false;
   for (unsigned i = 0; i < MAX_PREDICT_WIDTH; i++)
      pd_reg[i] = pre_decode_info_t();
   wb_idx_reg = 0;

   ftb_update_stall = 0;
   do_commit = false;
   for (unsigned i = 0; i < MAX_PREDICT_WIDTH; i++) {
      commit_row[i] = C_EMPTY;
      commit_mispredict[i] = false;
   }
   commit_cfi.valid = false;
   commit_cfi.offset = 0;
   commit_hit = H_NOT_HIT;
   commit_stage = BP_S1;
   commit_target_is_newest = false;
   commit_newest_target = 0;

   pc_mem_wen = false;
   pc_mem_waddr = 0;
   newest_entry_en_d1 = false;
   newest_entry_en_d2 = false;
   newest_entry_target = 0;

   mmio_last_commit = false;
}

bool ftq_state_t::get_mispredict(uint64_t idx, uint64_t offset) const {
   assert(offset < predict_width);
   return(mispredict[(idx * predict_width) + offset]);
}

void ftq_state_t::set_mispredict(uint64_t idx, uint64_t offset, bool m) {
   assert(offset < predict_width);
   mispredict[(idx * predict_width) + offset] = m;
}


ftq_t::ftq_t(uint64_t size, uint64_t predict_width, FILE *log) :
   ftb_entry_gen(predict_width),
   cur(size, predict_width),
   nxt(size, predict_width),
   pc_mem(size, PC_PORTS),
   redirect_mem(size, REDIRECT_PORTS),
   meta_mem(size, META_PORTS),
   pd_mem(size, PD_PORTS)
{
   assert(size >= 4);
   assert(IsPow2(predict_width) && (predict_width <= MAX_PREDICT_WIDTH));
   this->size = size;
   this->predict_width = predict_width;
   this->log = log;

   valid_entries = 0;
   resp_ready = false;
   ahead_sel_oh = 0;
   ahead_valid = false;
   real_ahead_valid = false;
   stage2_flush = false;
   backend_flush = false;
   ifu_flush = false;
   allow_bpu_in = false;
   allow_to_ifu = false;
   bpu_s2_redirect = false;
   bpu_s3_redirect = false;
   enq_fire = false;
   bpu_in_fire = false;
   bpu_in_stage = BP_S1;
   can_commit = false;
   can_move_comm = false;
}

void ftq_t::check_invariants() {
   const ftq_ptr_set_t &p = cur.ptr;
   assert(!(is_before(p.bpu, p.ifu) && !is_full(p.bpu, p.ifu)));
   assert(!(is_before(p.bpu, p.pf) && !is_full(p.bpu, p.pf)));
   assert(!(is_before(p.ifu_wb, p.comm) && !is_full(p.ifu_wb, p.comm)));
   assert(!(is_before(p.ifu, p.comm) && !is_full(p.ifu, p.comm)));
   assert(cur.ftb_update_stall != 3);
}

void ftq_t::step(const ftq_in_t &in, ftq_out_t &out) {
   out = ftq_out_t();
   nxt = cur;

   check_invariants();

   // Redirect sources and the global gates they drive.
   backend_redirect_in(in);
   ifu_redirect_in(in);
   allow_bpu_in = (!ifu_flush && !backend_redirect.valid && !cur.backend_redirect_reg_valid);
   allow_to_ifu = allow_bpu_in;

   commit_condition();

   enqueue(in, out);
   dispatch(in, out);
   bpu_self_redirect();
   writeback(in);
   redirect(in, out);
   commit(in, out);
   to_backend(out);

   // Table reads for the next cycle, addressed by the next cursors.
   pc_mem.read(PC_PORT_IFU, nxt.ptr.ifu.value);
   pc_mem.read(PC_PORT_IFU_PLUS1, nxt.ptr.ifu_plus1.value);
   pc_mem.read(PC_PORT_PF, nxt.ptr.pf.value);

   stats.cycles++;
   stats.entries += valid_entries;

   cur = nxt;
   pc_mem.tick();
   redirect_mem.tick();
   meta_mem.tick();
   pd_mem.tick();
}
