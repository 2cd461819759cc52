#include <cinttypes>
#include <cassert>

#include "decode.h"
#include "predecode.h"

#define BITS(x, lo, n)	(((x) >> (lo)) & ((((uint64_t)1) << (n)) - 1))

static int64_t sign_extend(uint64_t x, unsigned n) {
   return(((int64_t)(x << (64 - n))) >> (64 - n));
}

// c.j
static int64_t rvc_j_imm(uint64_t b) {
   uint64_t imm = ((BITS(b, 3, 3) << 1) |
                   (BITS(b, 11, 1) << 4) |
                   (BITS(b, 2, 1) << 5) |
                   (BITS(b, 7, 1) << 6) |
                   (BITS(b, 6, 1) << 7) |
                   (BITS(b, 9, 2) << 8) |
                   (BITS(b, 8, 1) << 10) |
                   (BITS(b, 12, 1) << 11));
   return(sign_extend(imm, 12));
}

// c.beqz, c.bnez
static int64_t rvc_b_imm(uint64_t b) {
   uint64_t imm = ((BITS(b, 3, 2) << 1) |
                   (BITS(b, 10, 2) << 3) |
                   (BITS(b, 2, 1) << 5) |
                   (BITS(b, 5, 2) << 6) |
                   (BITS(b, 12, 1) << 8));
   return(sign_extend(imm, 9));
}

uint64_t insn_length_of(uint64_t parcel) {
   return(((parcel & 3) == 3) ? 4 : 2);
}

bool is_link_reg(uint64_t x) {
   return((x == 1) || (x == 5));
}

predecode_t predecode(insn_t insn, uint64_t pc) {
   predecode_t d;
   uint64_t b = insn.bits();

   d.pd.valid = true;
   d.pd.br_type = BR_NOT_CFI;
   d.pd.is_call = false;
   d.pd.is_ret = false;
   d.length = insn_length_of(b);
   d.pd.is_rvc = (d.length == 2);
   d.target = 0;

   if (!d.pd.is_rvc) {
      switch (insn.opcode()) {
         case OPC_BRANCH:
            d.pd.br_type = BR_BRANCH;
            d.target = (pc + insn.sb_imm());
            break;

         case OPC_JAL:
            d.pd.br_type = BR_JAL;
            d.pd.is_call = is_link_reg(insn.rd());
            d.target = (pc + insn.uj_imm());
            break;

         case OPC_JALR:
            d.pd.br_type = BR_JALR;
            d.pd.is_call = is_link_reg(insn.rd());
            d.pd.is_ret = (is_link_reg(insn.rs1()) && !d.pd.is_call);
            break;

         default:
            break;
      }
      return(d);
   }

   uint64_t quadrant = BITS(b, 0, 2);
   uint64_t funct3 = BITS(b, 13, 3);
   uint64_t rs1 = BITS(b, 7, 5);
   uint64_t rs2 = BITS(b, 2, 5);

   if (quadrant == 1) {
      // RV64: funct3 001 is c.addiw, not c.jal.
      if (funct3 == 5) {
         d.pd.br_type = BR_JAL;
         d.target = (pc + rvc_j_imm(b));
      }
      else if ((funct3 == 6) || (funct3 == 7)) {
         d.pd.br_type = BR_BRANCH;
         d.target = (pc + rvc_b_imm(b));
      }
   }
   else if ((quadrant == 2) && (funct3 == 4) && (rs2 == 0) && (rs1 != 0)) {
      d.pd.br_type = BR_JALR;
      if (BITS(b, 12, 1)) {
         // c.jalr links through x1.
         d.pd.is_call = true;
      }
      else {
         // c.jr
         d.pd.is_ret = is_link_reg(rs1);
      }
   }
   return(d);
}
