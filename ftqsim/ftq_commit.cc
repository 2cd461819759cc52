#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "ftq.h"
#include "debug.h"

// Whether the entry at the commit cursor retires this cycle.
void ftq_t::commit_condition() {
   const ftq_ptr_set_t &p = cur.ptr;
   uint64_t idx = p.comm.value;

   bool may_have_stall_from_bpu = (cur.ftb_update_stall != 0);
   bool all_committed = cur.commit_state.last_committed(idx);

   can_commit = ((p.comm != p.ifu_wb) && !may_have_stall_from_bpu &&
                 (is_after(p.rob_comm, p.comm) || all_committed));
   // A block squashed from its first instruction is skipped without an update.
   can_move_comm = ((p.comm != p.ifu_wb) && !may_have_stall_from_bpu &&
                    (is_after(p.rob_comm, p.comm) || all_committed || cur.commit_state.first_flushed(idx)));

   valid_entries = distance_between(p.bpu, p.comm);
   resp_ready = ((valid_entries < size) || can_commit);
}

void ftq_t::commit(const ftq_in_t &in, ftq_out_t &out) {
   const ftq_ptr_set_t &p = cur.ptr;
   uint64_t idx = p.comm.value;

   // Furthest slot the backend has committed into.
   bool any_rob_commit = false;
   for (unsigned i = 0; i < MAX_COMMIT_WIDTH; i++) {
      if (in.backend.rob_commits[i].valid) {
         nxt.ptr.rob_comm = in.backend.rob_commits[i].ftq_idx;
         any_rob_commit = true;
      }
   }
   if (!any_rob_commit && is_after(p.comm, p.rob_comm))
      nxt.ptr.rob_comm = p.comm;

   // MMIO fetch may only go ahead once everything before it has retired.
   bool all_committed = cur.commit_state.last_committed(idx);
   nxt.mmio_last_commit = (in.mmio_valid &&
                           (is_after(p.comm, in.mmio_ptr) || ((p.comm == in.mmio_ptr) && all_committed)));
   out.mmio_last_commit = cur.mmio_last_commit;

   // Commit reads; the update is built next cycle.
   if (can_commit) {
      pc_mem.read(PC_PORT_COMM, idx);
      pc_mem.read(PC_PORT_COMM_PLUS1, p.comm_plus1.value);
      pd_mem.read(PD_PORT_COMMIT, idx);
      redirect_mem.read(REDIRECT_PORT_COMMIT, idx);
      meta_mem.read(META_PORT_COMMIT, idx);

      nxt.do_commit_ptr = p.comm;
      for (uint64_t i = 0; i < MAX_PREDICT_WIDTH; i++) {
         nxt.commit_row[i] = ((i < predict_width) ? cur.commit_state.get(idx, i) : C_EMPTY);
         nxt.commit_mispredict[i] = ((i < predict_width) ? cur.get_mispredict(idx, i) : false);
      }
      nxt.commit_cfi = cur.cfi_index[idx];
      nxt.commit_hit = cur.hit_status[idx];
      nxt.commit_stage = cur.pred_stage[idx];
      nxt.commit_target_is_newest = (p.comm == cur.newest_ptr);
      nxt.commit_newest_target = cur.newest_target;
   }
   nxt.do_commit = can_commit;

   if (can_move_comm) {
      nxt.ptr.comm = p.comm_plus1;
      nxt.ptr.comm_plus1 = p.comm_plus1 + 1;
   }

   // Cool-down: a miss that allocates in the FTB blocks commit for two cycles.
   const cfi_index_t &can_commit_cfi = cur.cfi_index[idx];
   bool to_bpu_hit = ((cur.hit_status[idx] == H_HIT) || (cur.hit_status[idx] == H_FALSE_HIT));
   switch (cur.ftb_update_stall) {
      case 0:
         if (can_commit_cfi.valid && !to_bpu_hit && can_commit)
            nxt.ftb_update_stall = 2;
         break;
      case 2:
         nxt.ftb_update_stall = 1;
         break;
      case 1:
         nxt.ftb_update_stall = 0;
         break;
      default:
         assert(0);
         break;
   }

   if (!cur.do_commit)
      return;

   ////////////////////////////////////////////////////////////////
   // Predictor update for the entry decided last cycle.
   ////////////////////////////////////////////////////////////////

   const ftq_pc_entry_t &commit_pc_bundle = pc_mem.rdata(PC_PORT_COMM);
   const ftq_pd_entry_t &commit_pd = pd_mem.rdata(PD_PORT_COMMIT);
   const ftq_meta_entry_t &commit_meta = meta_mem.rdata(META_PORT_COMMIT);
   uint64_t commit_target = (cur.commit_target_is_newest ? cur.commit_newest_target : pc_mem.rdata(PC_PORT_COMM_PLUS1).start_addr);
   bool commit_valid = ((cur.commit_hit == H_HIT) || cur.commit_cfi.valid);

   ftb_entry_gen_in_t gen_in;
   gen_in.start_addr = commit_pc_bundle.start_addr;
   gen_in.old_entry = commit_meta.ftb_entry;
   gen_in.pd = commit_pd;
   gen_in.cfi_index = cur.commit_cfi;
   gen_in.target = commit_target;
   gen_in.hit = (cur.commit_hit == H_HIT);
   for (uint64_t i = 0; i < MAX_PREDICT_WIDTH; i++)
      gen_in.mispredict_vec[i] = (cur.commit_mispredict[i] && (cur.commit_row[i] == C_COMMITTED));

   ftb_entry_gen_out_t gen;
   ftb_entry_gen.generate(gen_in, gen);

   bpu_update_t &u = out.update;
   u.valid = commit_valid;
   u.pc = commit_pc_bundle.start_addr;
   u.ftq_idx = cur.do_commit_ptr;
   for (unsigned i = 0; i < FTQ_META_WORDS; i++)
      u.meta[i] = commit_meta.meta[i];
   u.spec_info = redirect_mem.rdata(REDIRECT_PORT_COMMIT);
   u.ftb_entry = gen.new_entry;
   for (unsigned i = 0; i < NUM_BR; i++) {
      u.new_br_insert_pos[i] = gen.new_br_insert_pos[i];
      u.br_taken_mask[i] = gen.taken_mask[i];
      u.br_committed[i] = (gen.new_entry.br_valid(i) && (cur.commit_row[gen.new_entry.br_offset(i)] == C_COMMITTED));
   }
   for (unsigned i = 0; i <= NUM_BR; i++)
      u.mispred_mask[i] = gen.mispred_mask[i];
   u.jmp_taken = gen.jmp_taken;
   u.old_entry = gen.is_old_entry;
   u.pred_hit = ((cur.commit_hit == H_HIT) || (cur.commit_hit == H_FALSE_HIT));
   u.false_hit = (cur.commit_hit == H_FALSE_HIT);
   u.cfi_idx = cur.commit_cfi;
   u.full_target = commit_target;
   u.from_stage = cur.commit_stage;

   ifprintf(logging_on, log, "FTQ: commit ptr=%lu start=%lx cfi=%c%lu target=%lx%s%s%s%s%s%s\n",
            cur.do_commit_ptr.value, u.pc, (u.cfi_idx.valid ? 'v' : '-'), u.cfi_idx.offset, commit_target,
            (gen.is_init_entry ? " init" : ""), (gen.is_old_entry ? " old" : ""), (gen.is_new_br ? " new-br" : ""),
            (gen.is_jalr_target_modified ? " jalr-target" : ""), (gen.is_br_target_modified ? " br-target" : ""),
            (gen.is_strong_bias_modified ? " strong-bias" : ""));

   count_commit(gen, commit_pd);
   if (u.valid) {
      if (u.false_hit)
         stats.ftb_false_hit++;
      if (cur.commit_hit == H_HIT)
         stats.ftb_hit++;
      if (gen.is_init_entry) {
         stats.ftb_new_entry++;
         if (!gen.new_entry.jmp_valid())
            stats.ftb_new_entry_only_br++;
         if (!gen.new_entry.br_valid(0))
            stats.ftb_new_entry_only_jmp++;
         if (gen.new_entry.br_valid(0) && gen.new_entry.jmp_valid())
            stats.ftb_new_entry_br_and_jmp++;
      }
      if (gen.is_old_entry)
         stats.ftb_old_entry++;
      if (gen.is_new_br || gen.is_jalr_target_modified || gen.is_br_target_modified || gen.is_strong_bias_modified) {
         stats.ftb_modified_entry++;
         if (gen.is_new_br)
            stats.ftb_modified_entry_new_br++;
         if (gen.is_jalr_target_modified)
            stats.ftb_modified_entry_jalr_target++;
         if (gen.is_br_target_modified)
            stats.ftb_modified_entry_br_target++;
         if (gen.is_br_full)
            stats.ftb_modified_entry_br_full++;
         if (gen.is_strong_bias_modified)
            stats.ftb_modified_entry_strong_bias++;
      }
   }
}

// Right/wrong control-flow instructions of a committed block, by class and prediction stage.
void ftq_t::count_commit(const ftb_entry_gen_out_t &gen, const ftq_pd_entry_t &pd) {
   stats.commit_blocks++;
   for (uint64_t i = 0; i < predict_width; i++) {
      if (cur.commit_row[i] != C_COMMITTED)
         continue;
      stats.commit_instr++;

      bool is_jmp = (pd.jmp_valid && (pd.jmp_offset == i));
      if (!pd.br_mask[i] && !is_jmp)
         continue;

      bool wrong = cur.commit_mispredict[i];
      if (pd.br_mask[i])
         (wrong ? stats.br_w : stats.br_r)++;
      if (is_jmp && pd.has_jal())
         (wrong ? stats.jal_w : stats.jal_r)++;
      if (is_jmp && pd.has_jalr())
         (wrong ? stats.jalr_w : stats.jalr_r)++;
      if (is_jmp && pd.has_call())
         (wrong ? stats.call_w : stats.call_r)++;
      if (is_jmp && pd.has_ret())
         (wrong ? stats.ret_w : stats.ret_r)++;
      if (wrong)
         stats.mispredict_stage[cur.commit_stage]++;
   }
}

// Descriptor and newest-entry feed for the backend's own pc table.
void ftq_t::to_backend(ftq_out_t &out) {
   out.pc_mem_wen = cur.pc_mem_wen;
   out.pc_mem_waddr = cur.pc_mem_waddr;
   out.pc_mem_wdata = cur.pc_mem_wdata;
   nxt.pc_mem_wen = cur.last_cycle_bpu_in;
   if (cur.last_cycle_bpu_in) {
      nxt.pc_mem_waddr = cur.last_cycle_bpu_in_ptr.value;
      nxt.pc_mem_wdata = cur.bypass_buf;
   }

   out.newest_entry_en = cur.newest_entry_en_d2;
   out.newest_entry_ptr = cur.newest_entry_ptr;
   out.newest_entry_target = cur.newest_entry_target;
   nxt.newest_entry_en_d1 = (cur.last_cycle_bpu_in || backend_redirect.valid || ifu_redirect_to_bpu.valid);
   nxt.newest_entry_en_d2 = cur.newest_entry_en_d1;
   if (cur.newest_entry_en_d1) {
      nxt.newest_entry_ptr = cur.newest_ptr;
      nxt.newest_entry_target = cur.newest_target;
   }
}
