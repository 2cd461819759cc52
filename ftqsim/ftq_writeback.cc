#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "ftq.h"
#include "debug.h"

// Predecode writeback from the IFU.
void ftq_t::writeback(const ftq_in_t &in) {
   const pd_wb_t &wb = in.pd_wb;

   if (wb.valid) {
      uint64_t idx = wb.ftq_idx.value;
      assert(!is_after(wb.ftq_idx, cur.ptr.ifu));

      ftq_pd_entry_t pd_entry;
      pd_entry.from_pd_wb(wb, predict_width);
      pd_mem.write(idx, pd_entry);

      for (uint64_t i = 0; i < predict_width; i++) {
         if (wb.pd[i].valid && wb.instr_range[i])
            nxt.commit_state.set(idx, i, C_TO_COMMIT);
      }

      nxt.ptr.ifu_wb = cur.ptr.ifu_wb + 1;

      // The predicted FTB entry is checked against predecode next cycle.
      meta_mem.read(META_PORT_WB, idx);
      for (unsigned i = 0; i < MAX_PREDICT_WIDTH; i++)
         nxt.pd_reg[i] = wb.pd[i];
      nxt.wb_idx_reg = idx;

      ifprintf(logging_on, log, "FTQ: writeback ptr=%lu start=%lx mis=%c%lu\n",
               idx, wb.pc[0], (wb.mis_offset.valid ? 'v' : '-'), wb.mis_offset.offset);
   }

   bool hit_pd_valid = (wb.valid && (cur.hit_status[wb.ftq_idx.value] == H_HIT));
   nxt.hit_pd_valid = hit_pd_valid;
   nxt.hit_pd_mispred = (hit_pd_valid && wb.mis_offset.valid);

   if (cur.hit_pd_valid) {
      const ftb_entry_t &e = meta_mem.rdata(META_PORT_WB).ftb_entry;
      const pre_decode_info_t *pd = cur.pd_reg;

      // Branches the predictor recorded that predecode does not see.
      bool br_false_hit = false;
      for (unsigned i = 0; i < (NUM_BR - 1); i++) {
         const ftb_slot_t &s = e.br_slots[i];
         if (s.valid && !(pd[s.offset].valid && pd_is_br(pd[s.offset])))
            br_false_hit = true;
      }
      if (e.tail_slot.valid && e.tail_slot.sharing &&
          !(pd[e.tail_slot.offset].valid && pd_is_br(pd[e.tail_slot.offset])))
         br_false_hit = true;

      // The recorded jump is not the kind of jump predecode sees.
      const pre_decode_info_t &jmp_pd = pd[e.tail_slot.offset];
      bool jal_false_hit = (e.jmp_valid() &&
                            ((e.is_jal() && !(jmp_pd.valid && pd_is_jal(jmp_pd))) ||
                             (e.is_jalr && !(jmp_pd.valid && pd_is_jalr(jmp_pd))) ||
                             (e.is_call && !(jmp_pd.valid && jmp_pd.is_call)) ||
                             (e.is_ret && !(jmp_pd.valid && jmp_pd.is_ret))));

      if (br_false_hit || jal_false_hit || cur.hit_pd_mispred) {
         nxt.hit_status[cur.wb_idx_reg] = H_FALSE_HIT;
         ifprintf(logging_on, log, "FTQ: false hit ptr=%lu (br %d, jmp %d, mispred %d)\n",
                  cur.wb_idx_reg, (int)br_false_hit, (int)jal_false_hit, (int)cur.hit_pd_mispred);
      }
   }
}
