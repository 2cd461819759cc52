#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "ftq_stats.h"

ftq_stats_t::ftq_stats_t()
{
   memset(this, 0, sizeof(ftq_stats_t));
}

#define RATE(n, d) ((d) ? (100.0 * ((double)(n) / (double)(d))) : 0.0)

#define BP_OUTPUT(fp, str, r, w) \
   fprintf((fp), "%s%10lu %10lu %6.2lf%%\n", (str), (r) + (w), (w), RATE((w), (r) + (w)))

void ftq_stats_t::output(FILE *fp) const
{
   fprintf(fp, "FTQ MEASUREMENTS-----------------------------------\n");
   fprintf(fp, "cycles                  = %lu\n", cycles);
   fprintf(fp, "avg. valid entries      = %.2f\n", (cycles ? ((double)entries / (double)cycles) : 0.0));
   fprintf(fp, "bpu_to_ftq_stall        = %lu\n", bpu_to_ftq_stall);
   fprintf(fp, "from_bpu_real_bubble    = %lu\n", from_bpu_real_bubble);
   fprintf(fp, "bpu_s2_redirect         = %lu\n", bpu_s2_redirect);
   fprintf(fp, "bpu_s3_redirect         = %lu\n", bpu_s3_redirect);
   fprintf(fp, "to_ifu_bubble           = %lu\n", to_ifu_bubble);
   fprintf(fp, "to_ifu_stall            = %lu\n", to_ifu_stall);
   fprintf(fp, "bpu_to_ifu_bubble       = %lu\n", bpu_to_ifu_bubble);
   fprintf(fp, "fall_through_error      = %lu\n", fall_thru_error);
   fprintf(fp, "REDIRECTS------------------------------------------\n");
   fprintf(fp, "mispredict (backend)    = %lu\n", mispredict_redirect);
   fprintf(fp, "replay (backend)        = %lu\n", replay_redirect);
   fprintf(fp, "predecode (ifu)         = %lu\n", predecode_redirect);
   fprintf(fp, "redirect ahead valid    = %lu\n", redirect_ahead_valid);
   fprintf(fp, "COMMIT---------------------------------------------\n");
   fprintf(fp, "fetch blocks            = %lu\n", commit_blocks);
   fprintf(fp, "instructions            = %lu\n", commit_instr);
   fprintf(fp, "Type                      n          m     mr\n");
   BP_OUTPUT(fp, "Branch           ", br_r, br_w);
   BP_OUTPUT(fp, "Jal              ", jal_r, jal_w);
   BP_OUTPUT(fp, "Jalr             ", jalr_r, jalr_w);
   BP_OUTPUT(fp, "Call             ", call_r, call_w);
   BP_OUTPUT(fp, "Return           ", ret_r, ret_w);
   for (unsigned i = 1; i <= 3; i++)
      fprintf(fp, "mispredicts from s%u     = %lu\n", i, mispredict_stage[i]);
   fprintf(fp, "FTB UPDATES----------------------------------------\n");
   fprintf(fp, "hit                     = %lu\n", ftb_hit);
   fprintf(fp, "false hit               = %lu\n", ftb_false_hit);
   fprintf(fp, "new entry               = %lu (br %lu, jmp %lu, br+jmp %lu)\n",
           ftb_new_entry, ftb_new_entry_only_br, ftb_new_entry_only_jmp, ftb_new_entry_br_and_jmp);
   fprintf(fp, "old entry               = %lu\n", ftb_old_entry);
   fprintf(fp, "modified entry          = %lu (new br %lu, jalr target %lu, br target %lu, br full %lu, strong bias %lu)\n",
           ftb_modified_entry, ftb_modified_entry_new_br, ftb_modified_entry_jalr_target,
           ftb_modified_entry_br_target, ftb_modified_entry_br_full, ftb_modified_entry_strong_bias);
}
