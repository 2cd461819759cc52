#ifndef PREDECODE_H
#define PREDECODE_H
#include <cinttypes>

#include "decode.h"
#include "ftq_types.h"

// Major opcodes of the 4-byte control-flow instructions.
#define OPC_BRANCH	0x63
#define OPC_JAL		0x6f
#define OPC_JALR	0x67

// What the fetch side reads where there is no instruction.
#define PARCEL_C_NOP	0x0001

typedef
struct {
	pre_decode_info_t pd;
	uint64_t length;	// 2 or 4 bytes
	uint64_t target;	// static target of a branch or jal (0 otherwise)
} predecode_t;

// Length in bytes of the instruction whose first 16-bit parcel is "parcel".
uint64_t insn_length_of(uint64_t parcel);

// x1 and x5 are the link registers.
bool is_link_reg(uint64_t x);

predecode_t predecode(insn_t insn, uint64_t pc);

#endif //PREDECODE_H
