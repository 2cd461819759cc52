#include <cinttypes>
#include <cstdio>
#include <cassert>

#include "parameters.h"
#include "debug.h"
#include "predecode.h"
#include "backend.h"

backend_t::backend_t(uint64_t retire_width, const trace_t &oracle, FILE *log) : oracle(oracle) {
   assert((retire_width > 0) && (retire_width <= MAX_COMMIT_WIDTH));
   this->retire_width = retire_width;
   this->log = log;

   oracle_idx = 0;
   state = BE_EXECUTE;
   pending = ftq_redirect_t();
   committed = 0;
   flush_after = 0;
   flush_itself = 0;
}

void backend_t::drive(ftq_in_t &in) {
   backend_to_ftq_t &be = in.backend;

   for (uint64_t i = 0; i < to_commit.size(); i++)
      be.rob_commits[i] = to_commit[i];
   committed += to_commit.size();
   to_commit.clear();

   switch (state) {
      case BE_REDIRECT:
         // The lookahead index went out last cycle.
         be.redirect = pending;
         be.ftq_idx_sel_oh = 1;
         state = BE_SENT;
         break;
      case BE_EXECUTE:
         execute(be);
         break;
      default:
         assert(0);
         break;
   }
}

void backend_t::execute(backend_to_ftq_t &be) {
   uint64_t n = 0;
   while ((n < retire_width) && !ibuf.empty() && (oracle_idx < oracle.length())) {
      fetched_insn_t f = ibuf.front();

      // Wrong path at the head: squash it and fetch the right instruction.
      uint64_t expected = oracle.at(oracle_idx).pc;
      if (f.pc != expected) {
         make_redirect(f, FLUSH_ITSELF, expected, false, be);
         return;
      }

      bool last = ((oracle_idx + 1) == oracle.length());
      if (!last && (ibuf.size() < 2))
         break;

      rob_commit_t c;
      c.valid = true;
      c.ftq_idx = f.ftq_idx;
      c.ftq_offset = f.ftq_offset;
      c.commit_type = (pd_is_cfi(f.pd) ? 1 : 0);
      to_commit.push_back(c);

      uint64_t next = oracle.next_pc(oracle_idx);
      oracle_idx++;
      n++;

      if (!last && (ibuf[1].pc != next)) {
         uint64_t seq = (f.pc + (f.pd.is_rvc ? 2 : 4));
         make_redirect(f, FLUSH_AFTER, next, (ibuf[1].pc != seq), be);
         return;
      }
      ibuf.pop_front();
   }
}

void backend_t::make_redirect(const fetched_insn_t &f, redirect_level_e level, uint64_t target, bool pred_taken, backend_to_ftq_t &be) {
   uint64_t seq = (f.pc + (f.pd.is_rvc ? 2 : 4));

   pending = ftq_redirect_t();
   pending.valid = true;
   pending.ftq_idx = f.ftq_idx;
   pending.ftq_offset = f.ftq_offset;
   pending.level = level;
   pending.cause = ((level == FLUSH_AFTER) ? CAUSE_CTRL : CAUSE_OTHER);
   pending.pc = f.pc;
   pending.pd = f.pd;
   pending.pred_taken = pred_taken;
   pending.target = target;
   pending.taken = ((level == FLUSH_AFTER) && pd_is_cfi(f.pd) && (target != seq));
   pending.is_mispred = (level == FLUSH_AFTER);

   be.ftq_idx_ahead_valid[0] = true;
   be.ftq_idx_ahead[0] = f.ftq_idx;

   ibuf.clear();
   state = BE_REDIRECT;
   if (level == FLUSH_AFTER)
      flush_after++;
   else
      flush_itself++;

   ifprintf(logging_on, log, "BACKEND: redirect ptr=%lu off=%lu pc=%lx target=%lx%s\n",
            f.ftq_idx.value, f.ftq_offset, f.pc, target, ((level == FLUSH_ITSELF) ? " (itself)" : ""));
}

void backend_t::tick(const std::vector<fetched_insn_t> &fetched) {
   switch (state) {
      case BE_SENT:
         state = BE_EXECUTE;
         return;
      case BE_REDIRECT:
         return;
      default:
         break;
   }
   for (uint64_t i = 0; i < fetched.size(); i++)
      ibuf.push_back(fetched[i]);
}
