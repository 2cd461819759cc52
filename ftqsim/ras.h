#ifndef RAS_H
#define RAS_H
#include <cinttypes>
#include <vector>

// Circular return address stack.  "sp" indexes the top entry.
// A snapshot is the pair (sp, top address): restoring it also rewrites the top entry, which a
// wrong-path call may have overwritten.
class ras_t {
private:
	std::vector<uint64_t> stack;
	uint64_t sp;

	uint64_t wrap_inc(uint64_t i) const { return(((i + 1) == stack.size()) ? 0 : (i + 1)); }
	uint64_t wrap_dec(uint64_t i) const { return((i == 0) ? (stack.size() - 1) : (i - 1)); }

public:
	ras_t(uint64_t size);

	void push(uint64_t ret_addr);
	uint64_t pop();
	uint64_t peek() const { return(stack[sp]); }

	uint64_t get_sp() const { return(sp); }
	void restore(uint64_t sp, uint64_t top_addr);
};

#endif //RAS_H
