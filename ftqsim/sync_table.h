#ifndef SYNC_TABLE_H
#define SYNC_TABLE_H
#include <cinttypes>
#include <cassert>
#include <vector>

// A table with registered read ports and one write port.
//
// A read issued with read() in cycle t is available from rdata() in cycle t+1.
// A port that is not read in a cycle holds its last data.
// The write issued in a cycle is applied before reads are latched, so a same-cycle read sees it.
template <class T>
class sync_table_t {
private:
	uint64_t depth;
	unsigned int nread;

	std::vector<T> data;

	// read ports
	std::vector<bool> ren;
	std::vector<uint64_t> raddr;
	std::vector<T> rdata_q;

	// write port
	bool wen;
	uint64_t waddr;
	T wdata;

public:
	sync_table_t() : depth(0), nread(0), wen(false), waddr(0) {
	}

	sync_table_t(uint64_t depth, unsigned int nread) :
		depth(depth), nread(nread),
		data(depth), ren(nread, false), raddr(nread, 0), rdata_q(nread),
		wen(false), waddr(0) {
	}

	void read(unsigned int port, uint64_t addr) {
		assert(port < nread);
		assert(addr < depth);
		ren[port] = true;
		raddr[port] = addr;
	}

	const T &rdata(unsigned int port) const {
		assert(port < nread);
		return(rdata_q[port]);
	}

	void write(uint64_t addr, const T &d) {
		assert(!wen);
		assert(addr < depth);
		wen = true;
		waddr = addr;
		wdata = d;
	}

	// Clock edge.
	void tick() {
		if (wen) {
			data[waddr] = wdata;
			wen = false;
		}
		for (unsigned int i = 0; i < nread; i++) {
			if (ren[i]) {
				rdata_q[i] = data[raddr[i]];
				ren[i] = false;
			}
		}
	}

	// Unclocked view for debug and stats.
	const T &peek(uint64_t addr) const {
		assert(addr < depth);
		return(data[addr]);
	}
};

#endif //SYNC_TABLE_H
