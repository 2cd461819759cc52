#ifndef GSHARE_H
#define GSHARE_H
#include <cinttypes>
#include <vector>

// gshare direction predictor for the branches the FTB does not mark strongly biased.
class gshare_t {
private:
	// Global branch history register.
	uint64_t bhr;		// speculative state of the global branch history register
	uint64_t bhr_msb;	// used to set the msb of the bhr

	// Parameters for index generation.
	uint64_t pc_mask;
	uint64_t bhr_shamt;

	// 2-bit counters.
	std::vector<uint8_t> counters;

public:
	gshare_t(uint64_t pc_length, uint64_t bhr_length);

	uint64_t table_size() const { return(counters.size()); }

	uint64_t index(uint64_t pc, uint64_t my_bhr) const;

	// Prediction with a recorded bhr; training with the bhr the prediction used.
	bool predict(uint64_t pc, uint64_t my_bhr) const;
	void train(uint64_t pc, uint64_t my_bhr, bool taken);

	void update_bhr(bool taken);
	uint64_t update_my_bhr(uint64_t my_bhr, bool taken) const;

	// Functions to get and set the bhr, e.g., for checkpoint/restore purposes.
	uint64_t get_bhr() const { return(bhr); }
	void set_bhr(uint64_t bhr) { this->bhr = bhr; }
};

#endif //GSHARE_H
