// See LICENSE for license details.

#include <fesvr/option_parser.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <string>
#include <signal.h>
#include "debug.h"
#include "parameters.h"
#include "trace.h"
#include "ftq.h"
#include "bpu.h"
#include "ifu.h"
#include "backend.h"

// No commit for this many cycles means the front end and backend are stuck.
#define DEADLOCK_CYCLES 100000

static void help()
{
  fprintf(stderr, "usage: ftqsim [options] <trace file>\n");
  fprintf(stderr, "The trace file holds one \"<pc> <instruction>\" hex pair per line, in execution order.\n");
  fprintf(stderr, "Options:\n");
  fprintf(stderr, "  -e<n>              End simulation after <n> instructions have been committed\n");
  fprintf(stderr, "  -h                 Print this help message\n");
  fprintf(stderr, "  -l<n>              Enable logging after <n> commits (-1: from the start)\n");
  fprintf(stderr, "  --log=<file>       Write the event log to <file> instead of stderr\n");
  fprintf(stderr, "  --ftq=<n>          Fetch target queue has <n> entries (at least 4)\n");
  fprintf(stderr, "  --pw=<n>           Fetch blocks have <n> 2-byte slots (power-of-2, at most %d)\n", MAX_PREDICT_WIDTH);
  fprintf(stderr, "  --rw=<n>           <n> wide retire (at most %d)\n", MAX_COMMIT_WIDTH);
  fprintf(stderr, "  --ftb=<E>:<A>      FTB has <E> entries and a set-associativity of <A>\n");
  fprintf(stderr, "  --ras=<n>          RAS has <n> entries\n");
  fprintf(stderr, "  --cbpPC=<n>        The gshare-indexed conditional branch predictor uses <n> bits of PC\n");
  fprintf(stderr, "  --cbpBHR=<n>       The gshare-indexed conditional branch predictor uses <n> bits of BHR\n");
  fprintf(stderr, "  --phase=<n>        Phase interval is <n> cycles\n");
  exit(1);
}

/* execution start time */
time_t start_time;

static ftq_t *ftq;
static bpu_t *bpu;
static ifu_t *ifu;
static backend_t *backend;

static void sim_config(FILE* stream)
{
  fprintf(stream, "CONFIGURATION--------------------------------------\n");
  fprintf(stream, "ftq size                = %u\n", FTQ_SIZE);
  fprintf(stream, "predict width           = %u\n", PREDICT_WIDTH);
  fprintf(stream, "retire width            = %u\n", RETIRE_WIDTH);
  fprintf(stream, "ftb                     = %u entries, %u-way\n", FTB_ENTRIES, FTB_ASSOC);
  fprintf(stream, "ras                     = %u entries\n", RAS_SIZE);
  fprintf(stream, "gshare                  = %u bits of PC, %u bits of BHR\n", CBP_PC_LENGTH, CBP_BHR_LENGTH);
}

static void sim_stats(FILE* stream)
{
  if (!ftq)
    return;

  uint64_t cycles = ftq->stats.cycles;
  uint64_t committed = backend->get_committed();

  fprintf(stream, "OVERALL MEASUREMENTS-------------------------------\n");
  fprintf(stream, "cycles                  = %lu\n", cycles);
  fprintf(stream, "committed instructions  = %lu\n", committed);
  fprintf(stream, "ipc                     = %.2f\n", (cycles ? ((double)committed / (double)cycles) : 0.0));
  fprintf(stream, "seconds                 = %lu\n", (uint64_t)(time((time_t *)NULL) - start_time));

  ftq->stats.output(stream);

  fprintf(stream, "IFU MEASUREMENTS-----------------------------------\n");
  fprintf(stream, "jal not taken           = %lu\n", ifu->faults.jal_not_taken);
  fprintf(stream, "ret not taken           = %lu\n", ifu->faults.ret_not_taken);
  fprintf(stream, "not cfi taken           = %lu\n", ifu->faults.not_cfi_taken);
  fprintf(stream, "invalid taken           = %lu\n", ifu->faults.invalid_taken);
  fprintf(stream, "target fault            = %lu\n", ifu->faults.target_fault);

  fprintf(stream, "BACKEND MEASUREMENTS-------------------------------\n");
  fprintf(stream, "redirects (flush after) = %lu\n", backend->flush_after);
  fprintf(stream, "redirects (flush itself)= %lu\n", backend->flush_itself);
}

static void phase_stats(FILE* stream, uint64_t cycles, uint64_t last_cycles, uint64_t committed, uint64_t last_committed)
{
  uint64_t c = (cycles - last_cycles);
  uint64_t n = (committed - last_committed);
  fprintf(stream, "PHASE: cycles=%lu committed=%lu ipc=%.2f\n", cycles, committed, (c ? ((double)n / (double)c) : 0.0));
}

static void exit_now(int sigtype)
{
  sim_stats(stderr);
  exit(1);
}

static void config_ftb(const char* config)
{
  if (sscanf(config, "%u:%u", &FTB_ENTRIES, &FTB_ASSOC) != 2) {
    fprintf(stderr, "Incorrect usage of --ftb=<E>:<A>.\n");
    exit(-1);
  }
  if ((FTB_ASSOC == 0) || !IsPow2(FTB_ENTRIES / FTB_ASSOC)) {
    fprintf(stderr, "--ftb: FTB derived # sets (%u) must be a power-of-2.\n", ((FTB_ASSOC == 0) ? 0 : (FTB_ENTRIES / FTB_ASSOC)));
    exit(-1);
  }
}

static void check_config()
{
  if (FTQ_SIZE < 4) {
    fprintf(stderr, "--ftq: FTQ size (%u) must be at least 4.\n", FTQ_SIZE);
    exit(-1);
  }
  if (!IsPow2(PREDICT_WIDTH) || (PREDICT_WIDTH > MAX_PREDICT_WIDTH)) {
    fprintf(stderr, "--pw: predict width (%u) must be a power-of-2 no greater than %d.\n", PREDICT_WIDTH, MAX_PREDICT_WIDTH);
    exit(-1);
  }
  if ((RETIRE_WIDTH == 0) || (RETIRE_WIDTH > MAX_COMMIT_WIDTH)) {
    fprintf(stderr, "--rw: retire width (%u) must be 1 to %d.\n", RETIRE_WIDTH, MAX_COMMIT_WIDTH);
    exit(-1);
  }
  if ((CBP_PC_LENGTH == 0) || (CBP_PC_LENGTH > 30) || (CBP_BHR_LENGTH > 30)) {
    fprintf(stderr, "--cbpPC/--cbpBHR: gshare index lengths (%u, %u) must be 1 to 30.\n", CBP_PC_LENGTH, CBP_BHR_LENGTH);
    exit(-1);
  }
}

int main(int argc, char** argv)
{
  std::string log_file = "";

  option_parser_t parser;
  parser.help(&help);
  parser.option('h', 0, 0, [&](const char* s){help();});
  parser.option('l', 0, 1, [&](const char* s){logging_on_at = atoll(s);});
  parser.option('e', 0, 1, [&](const char* s){stop_amt = atoll(s); use_stop_amt = true;});
  parser.option(0, "log"   , 1, [&](const char* s){log_file = s;});
  parser.option(0, "ftq"   , 1, [&](const char* s){FTQ_SIZE = atoi(s);});
  parser.option(0, "pw"    , 1, [&](const char* s){PREDICT_WIDTH = atoi(s);});
  parser.option(0, "rw"    , 1, [&](const char* s){RETIRE_WIDTH = atoi(s);});
  parser.option(0, "ftb"   , 1, [&](const char* s){config_ftb(s);});
  parser.option(0, "ras"   , 1, [&](const char* s){RAS_SIZE = atoi(s);});
  parser.option(0, "cbpPC" , 1, [&](const char* s){CBP_PC_LENGTH = atoi(s);});
  parser.option(0, "cbpBHR", 1, [&](const char* s){CBP_BHR_LENGTH = atoi(s);});
  parser.option(0, "phase" , 1, [&](const char* s){phase_interval = atoll(s);});

  auto argv1 = parser.parse(argv);
  if (!*argv1)
    help();
  check_config();

  FILE *fp = fopen(argv1[0], "r");
  if (!fp) {
    fprintf(stderr, "Could not open the trace file '%s'.\n", argv1[0]);
    exit(-1);
  }
  trace_t trace;
  uint64_t bad_line;
  bool loaded = trace.load(fp, bad_line);
  fclose(fp);
  if (!loaded) {
    fprintf(stderr, "%s:%lu: malformed or inconsistent trace record.\n", argv1[0], bad_line);
    exit(-1);
  }
  if (trace.length() == 0) {
    fprintf(stderr, "The trace file '%s' is empty.\n", argv1[0]);
    exit(-1);
  }

  FILE *log = stderr;
  if (log_file != "") {
    log = fopen(log_file.c_str(), "w");
    if (!log) {
      fprintf(stderr, "Could not open the log file '%s'.\n", log_file.c_str());
      exit(-1);
    }
  }

  /* opening banner */
  fprintf(stderr, "\nftqsim: cycle-level model of a fetch target queue, with the branch\n");
  fprintf(stderr, "predictor, fetch unit and backend it decouples.  It uses the RISCV ISA.\n\n");

  struct sigaction sigIntHandler;

  sigIntHandler.sa_handler = exit_now;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;

  sigaction(SIGINT,   &sigIntHandler, NULL);

  /* record start of execution time, used in rate stats */
  start_time = time((time_t *)NULL);

  /* output simulation conditions */
  sim_config(stderr);

  // Turn on logging if user requested logging from the start.
  if (logging_on_at == -1)
    logging_on = true;

  ftq = new ftq_t(FTQ_SIZE, PREDICT_WIDTH, log);
  bpu = new bpu_t(PREDICT_WIDTH, FTB_ENTRIES, FTB_ASSOC, RAS_SIZE, CBP_PC_LENGTH, CBP_BHR_LENGTH, log);
  ifu = new ifu_t(PREDICT_WIDTH, trace, log);
  backend = new backend_t(RETIRE_WIDTH, trace, log);

  bpu->reset(trace.at(0).pc);

  uint64_t last_commit_cycle = 0;
  uint64_t last_committed = 0;
  uint64_t phase_cycles = 0;
  uint64_t phase_committed = 0;

  while (!backend->done() && !(use_stop_amt && (backend->get_committed() >= stop_amt))) {
    ftq_in_t in = ftq_in_t();
    ftq_out_t out = ftq_out_t();

    bpu->drive(in.bpu);
    ifu->drive(in);
    backend->drive(in);

    ftq->step(in, out);

    bpu->tick(in.bpu, out);
    ifu->tick(out);
    backend->tick(ifu->get_fetched());

    uint64_t cycles = ftq->stats.cycles;
    uint64_t committed = backend->get_committed();

    if (!logging_on && (logging_on_at > 0) && (committed >= (uint64_t)logging_on_at))
      logging_on = true;

    if (committed != last_committed) {
      last_committed = committed;
      last_commit_cycle = cycles;
    }
    else if ((cycles - last_commit_cycle) > DEADLOCK_CYCLES) {
      fprintf(stderr, "No instruction committed in %d cycles (cycle %lu, %lu committed).\n", DEADLOCK_CYCLES, cycles, committed);
      sim_stats(stderr);
      exit(-1);
    }

    if (phase_interval && ((cycles % phase_interval) == 0)) {
      phase_stats(stderr, cycles, phase_cycles, committed, phase_committed);
      phase_cycles = cycles;
      phase_committed = committed;
    }
  }

  sim_stats(stdout);

  if (log != stderr)
    fclose(log);
  return 0;
}
