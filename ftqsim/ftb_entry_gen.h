#ifndef FTB_ENTRY_GEN_H
#define FTB_ENTRY_GEN_H
#include <cinttypes>

#include "parameters.h"
#include "ftb_entry.h"
#include "ftq_types.h"

typedef
struct {
	uint64_t start_addr;
	ftb_entry_t old_entry;		// entry the block was predicted with
	ftq_pd_entry_t pd;
	cfi_index_t cfi_index;		// committed taken control-flow instruction
	uint64_t target;		// committed next block start
	bool hit;			// real hit (not a false hit)
	bool mispredict_vec[MAX_PREDICT_WIDTH];
} ftb_entry_gen_in_t;

typedef
struct {
	ftb_entry_t new_entry;
	bool new_br_insert_pos[NUM_BR];	// one-hot: the new branch goes before old slot i
	bool taken_mask[NUM_BR];
	bool jmp_taken;
	bool mispred_mask[NUM_BR + 1];

	// Which path produced the entry.
	bool is_init_entry;
	bool is_old_entry;
	bool is_new_br;
	bool is_jalr_target_modified;
	bool is_br_target_modified;
	bool is_strong_bias_modified;
	bool is_br_full;
} ftb_entry_gen_out_t;

// Builds the FTB entry to write back for a committed fetch block.
// Without a hit a fresh entry is built; with a hit the old entry is extended with a new branch,
// retargeted for a jalr, or has its strong-bias bits decayed (and a recorded branch retargeted),
// in that priority order.
class ftb_entry_gen_t {
private:
	uint64_t predict_width;
	uint64_t log2pw;

	uint64_t get_lower(uint64_t pc) const;

	void init_entry(const ftb_entry_gen_in_t &in, ftb_entry_t &e) const;
	void insert_new_br(const ftb_entry_gen_in_t &in, const bool insert_onehot[], bool pft_need_to_change, ftb_entry_t &e) const;

public:
	ftb_entry_gen_t(uint64_t predict_width);

	void generate(const ftb_entry_gen_in_t &in, ftb_entry_gen_out_t &out) const;
};

#endif //FTB_ENTRY_GEN_H
