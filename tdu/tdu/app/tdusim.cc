#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <getopt.h>

#include "tdu/core/Unit.hh"
#include "tdu/fine/MmcmPhaseShifter.hh"
#include "tdu/service/kwargs.hh"
#include "tdu/service/Replay.hh"
#include "tdu/service/SysLog.hh"
#include "tdu/service/UnitConfig.hh"

#include <memory>
#include <string>

using logging = Tdu::SysLog;

extern int optind;

static void usage(const char* p) {
  printf("Usage: %s -t <trace.json> [options]\n",p);
  printf("          -t <file> : trace to replay\n");
  printf("          -c <file> : JSON configuration\n");
  printf("          -k <k=v>  : configuration overrides (repeatable, comma separated)\n");
  printf("          -L        : loop the soft trigger monitor back onto the input\n");
  printf("          -j        : print records as JSON\n");
  printf("          -v        : verbose; dump registers at the end\n");
}

int main(int argc, char** argv) {

  extern char* optarg;

  int c;
  bool lUsage  = false;
  bool lJson   = false;
  bool lLoop   = false;
  unsigned verbose = 0;
  std::string configFile;
  std::string traceFile;
  std::string kwargs_str;

  while ( (c=getopt( argc, argv, "t:c:k:Ljvh?")) != EOF ) {
    switch(c) {
    case 't':
      traceFile = optarg;
      break;
    case 'c':
      configFile = optarg;
      break;
    case 'k':
      kwargs_str = kwargs_str.empty()
                 ? optarg
                 : kwargs_str + ", " + optarg;
      break;
    case 'L':
      lLoop = true;
      break;
    case 'j':
      lJson = true;
      break;
    case 'v':
      ++verbose;
      break;
    case 'h':
      usage(argv[0]);
      exit(0);
    case '?':
    default:
      lUsage = true;
      break;
    }
  }

  if (optind < argc) {
    printf("%s: invalid argument -- %s\n",argv[0], argv[optind]);
    lUsage = true;
  }

  if (traceFile.empty()) {
    printf("%s: -t <trace> is mandatory\n",argv[0]);
    lUsage = true;
  }

  if (lUsage) {
    usage(argv[0]);
    exit(1);
  }

  logging::init(0, verbose ? LOG_DEBUG : LOG_INFO);

  try {
    Tdu::UnitConfig config;
    if (!configFile.empty())
      config.load(configFile);

    std::map<std::string,std::string> kwargs;
    Tdu::get_kwargs(kwargs_str, kwargs);
    config.apply(kwargs);
    if (lLoop)
      config.loopback = true;

    if (verbose)
      config.dump();

    std::unique_ptr<Tdu::Fine::MmcmPhaseShifter> offset;
    std::unique_ptr<Tdu::Fine::MmcmPhaseShifter> width;
    if (config.fineEnabled) {
      offset = std::make_unique<Tdu::Fine::MmcmPhaseShifter>(config.fineStepTicks,
                                                             config.fineStepsPerCycle);
      width  = std::make_unique<Tdu::Fine::MmcmPhaseShifter>(config.fineStepTicks,
                                                             config.fineStepsPerCycle);
    }

    Tdu::Trace trace;
    trace.load(traceFile);

    Tdu::Core::Unit unit(config.unit, offset.get(), width.get());
    Tdu::Replay replay(unit, config.loopback);

    std::vector<Tdu::Record> records;
    replay.run(trace, records);

    if (lJson)
      printf("%s\n", Tdu::Replay::toJson(records).dump(2).c_str());
    else
      Tdu::Replay::print(records, config.tickNs);

    if (verbose) {
      unit.dump();
      if (offset) offset->dump();
      if (width)  width ->dump();
    }

    const Tdu::Cmd::Counters& cnt = unit.command().counters();
    logging::info("%llu ticks: %u triggers, %llu commands, %llu dropped opcodes",
                  (unsigned long long)unit.ticks(),
                  unit.generator().triggers(),
                  (unsigned long long)cnt.commands,
                  (unsigned long long)cnt.droppedOpcodes);
    return 0;
  }
  catch (std::exception& e)  { logging::critical("%s", e.what()); }
  catch (std::string& e)     { logging::critical("%s", e.c_str()); }
  catch (char const* e)      { logging::critical("%s", e); }
  return EXIT_FAILURE;
}
