#ifndef TRACE_H
#define TRACE_H
#include <cinttypes>
#include <cstdio>
#include <vector>
#include <unordered_map>

// One dynamic instruction of the committed path.
typedef
struct {
	uint64_t pc;
	uint64_t bits;		// 16 or 32 bits of instruction
} trace_record_t;

// Instruction memory and oracle, built from a text trace of "<pc> <instruction>" hex pairs
// in execution order.
class trace_t {
private:
	std::vector<trace_record_t> records;
	std::unordered_map<uint64_t, uint64_t> image;	// static instruction at each pc

public:
	trace_t();

	// Returns false, with the offending line number, on a malformed or inconsistent trace.
	bool load(FILE *fp, uint64_t &bad_line);
	void append(uint64_t pc, uint64_t bits);

	uint64_t length() const { return(records.size()); }
	const trace_record_t &at(uint64_t i) const { return(records[i]); }

	// Correct pc after dynamic instruction i.
	uint64_t next_pc(uint64_t i) const;

	// 16-bit parcel at "addr".  Addresses the program never executes read as c.nop.
	uint64_t parcel(uint64_t addr) const;

	// Instruction bits starting at "addr", as far as the parcels there tell.
	uint64_t fetch(uint64_t addr) const;
};

#endif //TRACE_H
