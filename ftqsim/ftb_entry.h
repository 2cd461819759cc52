#ifndef FTB_ENTRY_H
#define FTB_ENTRY_H
#include <cinttypes>

#define NUM_BR			2	// branch slots per entry (the last one is the shared tail slot)
#define VADDR_BITS		39
#define INST_OFFSET_BITS	1	// slots are 2 bytes
#define BR_OFFSET_LEN		12	// target bits kept by a branch slot
#define JMP_OFFSET_LEN		20	// target bits kept by the tail slot

#define VADDR_MASK ((((uint64_t)1) << VADDR_BITS) - 1)

// How the high-order target bits relate to the high-order bits of the block start.
typedef
enum {
   TAR_FIT = 0,	// same
   TAR_OVF = 1,	// one above
   TAR_UDF = 2	// one below
} tar_stat_e;


class ftb_slot_t {
public:
	bool valid;
	uint64_t offset;	// position of the control-flow instruction in the block
	bool sharing;		// tail slot only: it currently records a branch, not a jump
	uint64_t lower;		// low-order target bits, without the 2-byte alignment bit
	tar_stat_e tar_stat;
	uint64_t offset_len;	// number of target bits this slot can keep
	bool has_sub_offset;	// tail slot only: may also hold a branch (BR_OFFSET_LEN bits)

	ftb_slot_t();
	ftb_slot_t(uint64_t offset_len, bool has_sub_offset);

	void set_lower_stat_by_target(uint64_t pc, uint64_t target, bool is_share);
	uint64_t get_target(uint64_t pc) const;
	void from_another_slot(const ftb_slot_t &that);

	bool operator==(const ftb_slot_t &that) const;
	bool operator!=(const ftb_slot_t &that) const;
};


// Compact branch target buffer record for one fetch block.
// Slot i of "all slots for br" is br_slots[i] for i < NUM_BR-1, and tail_slot for i == NUM_BR-1.
class ftb_entry_t {
public:
	bool valid;
	ftb_slot_t br_slots[NUM_BR - 1];
	ftb_slot_t tail_slot;

	// Partial fall-through address: log2(PREDICT_WIDTH) bits of slot index plus a carry into the higher bits.
	uint64_t pft_addr;
	bool carry;

	bool is_call;
	bool is_ret;
	bool is_jalr;
	bool last_may_be_rvi_call;	// fall-through points into the middle of a 4-byte call

	bool strong_bias[NUM_BR];

	ftb_entry_t();

	ftb_slot_t &slot_for_br(unsigned i);
	const ftb_slot_t &slot_for_br(unsigned i) const;

	bool br_valid(unsigned i) const;	// branch recorded in slot i (tail counts only when sharing)
	uint64_t br_offset(unsigned i) const;
	bool jmp_valid() const;			// tail slot records a jump
	bool is_jal() const;

	bool br_recorded(unsigned i, uint64_t offset) const;
	bool br_is_saved(uint64_t offset) const;
	unsigned br_count_up_to(uint64_t offset) const;	// recorded branches at or before offset
	bool new_br_can_not_insert(uint64_t offset) const;
	bool no_empty_slot_for_new_br() const;

	void set_by_br_target(unsigned i, uint64_t pc, uint64_t target);
	void set_by_jmp_target(uint64_t pc, uint64_t target);

	uint64_t get_fall_through(uint64_t pc, uint64_t predict_width) const;
	uint64_t get_target(unsigned i, uint64_t pc) const;

	bool operator==(const ftb_entry_t &that) const;
	bool operator!=(const ftb_entry_t &that) const;
};

uint64_t log2_width(uint64_t predict_width);

// Slot index of "pc" within an aligned window of predict_width slots.
uint64_t pc_lower(uint64_t pc, uint64_t predict_width);

#endif //FTB_ENTRY_H
