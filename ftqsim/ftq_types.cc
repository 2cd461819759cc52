#include <cinttypes>
#include <cassert>

#include "ftq_types.h"
#include "ftq_io.h"

bool pd_is_br(const pre_decode_info_t &pd) {
   return(pd.br_type == BR_BRANCH);
}

bool pd_is_jal(const pre_decode_info_t &pd) {
   return(pd.br_type == BR_JAL);
}

bool pd_is_jalr(const pre_decode_info_t &pd) {
   return(pd.br_type == BR_JALR);
}

bool pd_is_cfi(const pre_decode_info_t &pd) {
   return(pd.br_type != BR_NOT_CFI);
}


ftq_pc_entry_t::ftq_pc_entry_t() {
   start_addr = 0;
   next_line_addr = 0;
   for (unsigned i = 0; i < MAX_PREDICT_WIDTH; i++)
      is_next_mask[i] = false;
   fall_thru_error = false;
}

void ftq_pc_entry_t::from_branch_prediction(uint64_t start, bool fall_thru_error, uint64_t predict_width) {
   assert(predict_width <= MAX_PREDICT_WIDTH);
   uint64_t log2pw = log2_width(predict_width);

   start_addr = start;
   next_line_addr = start + (predict_width * 4);
   for (uint64_t i = 0; i < MAX_PREDICT_WIDTH; i++)
      is_next_mask[i] = ((i < predict_width) && (((pc_lower(start, predict_width) + i) >> log2pw) & 1));
   this->fall_thru_error = fall_thru_error;
}

// Rebuild the pc of the instruction at "offset" from the start and next-line addresses.
uint64_t ftq_pc_entry_t::get_pc(uint64_t offset, uint64_t predict_width) const {
   assert(offset < predict_width);
   uint64_t log2pw = log2_width(predict_width);
   uint64_t window = (2 * predict_width) - 1;

   bool use_next_line = (is_next_mask[offset] && ((start_addr >> (log2pw + INST_OFFSET_BITS)) & 1));
   uint64_t higher = ((use_next_line ? next_line_addr : start_addr) >> (log2pw + INST_OFFSET_BITS + 1));
   uint64_t low = ((((start_addr >> INST_OFFSET_BITS) & window) + offset) & window);
   return((higher << (log2pw + INST_OFFSET_BITS + 1)) | (low << INST_OFFSET_BITS));
}


ftq_pd_entry_t::ftq_pd_entry_t() {
   for (unsigned i = 0; i < MAX_PREDICT_WIDTH; i++) {
      br_mask[i] = false;
      rvc_mask[i] = false;
   }
   jmp_valid = false;
   jmp_is_jalr = false;
   jmp_is_call = false;
   jmp_is_ret = false;
   jmp_offset = 0;
   jal_target = 0;
}

void ftq_pd_entry_t::from_pd_wb(const pd_wb_t &wb, uint64_t predict_width) {
   jmp_valid = false;
   jmp_is_jalr = false;
   jmp_is_call = false;
   jmp_is_ret = false;
   jmp_offset = 0;
   for (uint64_t i = 0; i < MAX_PREDICT_WIDTH; i++) {
      const pre_decode_info_t &pd = wb.pd[i];
      bool in_block = (i < predict_width);
      br_mask[i] = (in_block && pd.valid && pd_is_br(pd));
      rvc_mask[i] = (in_block && pd.is_rvc);
      if (in_block && pd.valid && (pd_is_jal(pd) || pd_is_jalr(pd)) && !jmp_valid) {
         jmp_valid = true;
         jmp_is_jalr = pd_is_jalr(pd);
         jmp_is_call = pd.is_call;
         jmp_is_ret = pd.is_ret;
         jmp_offset = i;
      }
   }
   jal_target = wb.jal_target;
}

pre_decode_info_t ftq_pd_entry_t::to_pd(uint64_t offset) const {
   pre_decode_info_t pd;
   bool is_jmp = (jmp_valid && (offset == jmp_offset));

   pd.valid = true;
   pd.is_rvc = rvc_mask[offset];
   if (is_jmp)
      pd.br_type = (jmp_is_jalr ? BR_JALR : BR_JAL);
   else if (br_mask[offset])
      pd.br_type = BR_BRANCH;
   else
      pd.br_type = BR_NOT_CFI;
   pd.is_call = (is_jmp && jmp_is_call);
   pd.is_ret = (is_jmp && jmp_is_ret);
   return(pd);
}

bool ftq_pd_entry_t::has_jal() const {
   return(jmp_valid && !jmp_is_jalr);
}

bool ftq_pd_entry_t::has_jalr() const {
   return(jmp_valid && jmp_is_jalr);
}

bool ftq_pd_entry_t::has_call() const {
   return(jmp_valid && jmp_is_call);
}

bool ftq_pd_entry_t::has_ret() const {
   return(jmp_valid && jmp_is_ret);
}


bool flush_itself(const ftq_redirect_t &r) {
   return(r.valid && (r.level == FLUSH_ITSELF));
}

bool should_flush_by_stage(bool stage_valid, const ftq_ptr_t &stage_idx, const ftq_ptr_t &ptr) {
   return(stage_valid && ((stage_idx == ptr) || is_before(stage_idx, ptr)));
}

bool should_flush_by(const bpu_flush_info_t &info, const ftq_ptr_t &ptr) {
   return(should_flush_by_stage(info.s2_valid, info.s2, ptr) || should_flush_by_stage(info.s3_valid, info.s3, ptr));
}
