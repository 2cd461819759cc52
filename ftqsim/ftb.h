#ifndef FTB_H
#define FTB_H
#include <cinttypes>

#include "ftb_entry.h"

// One way of the fetch target buffer.
typedef
struct {
   // Metadata for hit/miss determination and replacement.
   bool valid;
   uint64_t tag;
   uint64_t lru;

   // Payload.
   ftb_entry_t entry;
} ftb_way_t;


// Set-associative fetch target buffer, indexed by the start pc of a fetch block.
class ftb_t {
private:
	// ftb[set][way]
	ftb_way_t **ftb;
	uint64_t sets;
	uint64_t assoc;
	uint64_t log2sets;

	void convert(uint64_t pc, uint64_t &set, uint64_t &tag);
	bool search(uint64_t set, uint64_t tag, uint64_t &way);
	void update_lru(uint64_t set, uint64_t way);

public:
	ftb_t(uint64_t num_entries, uint64_t assoc);
	~ftb_t();

	bool lookup(uint64_t pc, ftb_entry_t &entry);
	void update(uint64_t pc, const ftb_entry_t &entry);
};

#endif //FTB_H
