#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <getopt.h>
#include <poll.h>
#include <signal.h>

#include "tdu/core/Unit.hh"
#include "tdu/fine/MmcmPhaseShifter.hh"
#include "tdu/service/kwargs.hh"
#include "tdu/service/SerialPort.hh"
#include "tdu/service/SysLog.hh"
#include "tdu/service/UnitConfig.hh"

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <vector>

using logging = Tdu::SysLog;

extern int optind;

static std::atomic<bool> lRunning(true);

static void sigHandler(int)
{
  lRunning.store(false, std::memory_order_release);
}

static void usage(const char* p) {
  printf("Usage: %s [options]\n",p);
  printf("          -d <dev>   : serial device (default: allocate a pseudo-terminal)\n");
  printf("          -b <baud>  : baud rate\n");
  printf("          -c <file>  : JSON configuration\n");
  printf("          -k <k=v>   : configuration overrides (repeatable, comma separated)\n");
  printf("          -n <ticks> : ticks run between polls [10000]\n");
  printf("          -p <ms>    : poll timeout [1]\n");
  printf("          -r <ticks> : toggle the external input with this half period\n");
  printf("          -L         : loop the soft trigger monitor back onto the input\n");
  printf("          -v         : verbose\n");
}

int main(int argc, char** argv) {

  extern char* optarg;

  int c;
  bool lUsage = false;
  bool lLoop  = false;
  unsigned verbose = 0;
  unsigned batch   = 10000;
  int      pollMs  = 1;
  uint64_t period  = 0;
  std::string device;
  int baud = -1;
  std::string configFile;
  std::string kwargs_str;

  while ( (c=getopt( argc, argv, "d:b:c:k:n:p:r:Lvh?")) != EOF ) {
    switch(c) {
    case 'd':
      device = optarg;
      break;
    case 'b':
      baud = strtoul(optarg,NULL,0);
      break;
    case 'c':
      configFile = optarg;
      break;
    case 'k':
      kwargs_str = kwargs_str.empty()
                 ? optarg
                 : kwargs_str + ", " + optarg;
      break;
    case 'n':
      batch = strtoul(optarg,NULL,0);
      break;
    case 'p':
      pollMs = strtol(optarg,NULL,0);
      break;
    case 'r':
      period = strtoull(optarg,NULL,0);
      break;
    case 'L':
      lLoop = true;
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

  if (batch == 0) {
    printf("%s: -n must be positive\n",argv[0]);
    lUsage = true;
  }

  if (lUsage) {
    usage(argv[0]);
    exit(1);
  }

  logging::init(0, verbose ? LOG_DEBUG : LOG_INFO);

  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = sigHandler;
  sigaction(SIGINT , &sa, NULL);
  sigaction(SIGTERM, &sa, NULL);

  try {
    Tdu::UnitConfig config;
    if (!configFile.empty())
      config.load(configFile);

    std::map<std::string,std::string> kwargs;
    Tdu::get_kwargs(kwargs_str, kwargs);
    config.apply(kwargs);
    if (!device.empty())
      config.device = device;
    if (baud >= 0)
      config.baud = baud;
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

    Tdu::SerialPort port(config.device, config.baud);
    printf("Serving on %s\n", port.name().c_str());
    fflush(stdout);

    Tdu::Core::Unit unit(config.unit, offset.get(), width.get());

    std::deque<uint8_t>  rxq;
    std::vector<uint8_t> txq;
    uint8_t buf[256];
    bool    input  = false;
    bool    output = false;
    uint64_t pulses = 0;

    while (lRunning.load(std::memory_order_acquire)) {
      struct pollfd pfd;
      pfd.fd      = port.fd();
      pfd.events  = POLLIN;
      pfd.revents = 0;
      if (poll(&pfd, 1, pollMs) > 0 && (pfd.revents & POLLIN)) {
        ssize_t n = port.read(buf, sizeof(buf));
        rxq.insert(rxq.end(), buf, buf+n);
      }

      for(unsigned i=0; i<batch; i++) {
        if (period && (unit.ticks() % period) == 0 && unit.ticks())
          input = !input;

        const uint8_t* rx = 0;
        uint8_t byte = 0;
        if (!rxq.empty() && unit.rxReady()) {
          byte = rxq.front();
          rxq.pop_front();
          rx = &byte;
        }

        bool line = input || (config.loopback && unit.monitor());
        unit.tick(line, rx);

        if (unit.txValid())
          txq.push_back(unit.txByte());
        if (unit.output() && !output)
          pulses++;
        output = unit.output();
      }

      if (!txq.empty()) {
        port.write(txq.data(), txq.size());
        txq.clear();
      }
    }

    const Tdu::Cmd::Counters& cnt = unit.command().counters();
    logging::info("Stopped after %llu ticks: %llu output pulses, trigger counter %u",
                  (unsigned long long)unit.ticks(),
                  (unsigned long long)pulses,
                  unit.generator().triggers());
    logging::info("Commands %llu, dropped opcodes %llu, payload timeouts %llu, fine timeouts %llu",
                  (unsigned long long)cnt.commands,
                  (unsigned long long)cnt.droppedOpcodes,
                  (unsigned long long)cnt.payloadTimeouts,
                  (unsigned long long)cnt.fineTimeouts);
    if (verbose)
      unit.dump();
    return 0;
  }
  catch (std::exception& e)  { logging::critical("%s", e.what()); }
  catch (std::string& e)     { logging::critical("%s", e.c_str()); }
  catch (char const* e)      { logging::critical("%s", e); }
  return EXIT_FAILURE;
}
