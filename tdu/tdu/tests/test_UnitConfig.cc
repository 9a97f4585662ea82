#ifdef NDEBUG
#undef NDEBUG
#endif

#include "tdu/service/UnitConfig.hh"
#include "tdu/service/kwargs.hh"

#include <assert.h>
#include <stdio.h>
#include <unistd.h>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

using namespace Tdu;

template <typename F>
static bool throws(F f)
{
  try {
    f();
  }
  catch (const std::runtime_error& e) {
    printf("  expected: %s\n", e.what());
    return true;
  }
  catch (const json::exception& e) {
    printf("  expected: %s\n", e.what());
    return true;
  }
  return false;
}

static void testDefaults()
{
  printf("----- defaults\n");
  UnitConfig c;
  assert(c.unit.syncStages==3);
  assert(c.unit.payloadTimeout==1000000);
  assert(c.unit.fineTimeout==(1u<<24));
  assert(c.tickNs==5.0);
  assert(c.fineEnabled && c.fineStepTicks==12 && c.fineStepsPerCycle==560);
  assert(!c.loopback && c.device.empty() && c.baud==1000000);
  const Core::Config& p = c.unit.powerOn;
  assert(p.coarseDelay==0 && p.outputWidth==1);
  assert(p.edge==Core::EdgeRising);
  assert(p.triggerMode==Core::External && p.armedMode==Core::Single);
  assert(!p.counterMode && p.edgeCountTarget==1 && p.softTriggerWidth==10);
}

static void testParse()
{
  printf("----- parse\n");
  UnitConfig c;
  c.parse(json::parse(R"({
    "sync_stages": 4,
    "tick_ns": 2.5,
    "payload_timeout_ticks": 500,
    "fine_enabled": false,
    "loopback": true,
    "device": "/dev/ttyUSB1",
    "baud": 115200,
    "power_on": { "coarse_delay": 200, "edge": "both", "trigger_mode": "internal",
                  "armed_mode": 1, "counter_mode": true, "edge_count_target": 4 }
  })"));
  assert(c.unit.syncStages==4 && c.tickNs==2.5 && c.unit.payloadTimeout==500);
  assert(!c.fineEnabled && c.loopback);
  assert(c.device=="/dev/ttyUSB1" && c.baud==115200);
  const Core::Config& p = c.unit.powerOn;
  assert(p.coarseDelay==200 && p.outputWidth==1);
  assert(p.edge==Core::EdgeBoth && p.triggerMode==Core::Internal);
  assert(p.armedMode==Core::Repeat && p.counterMode && p.edgeCountTarget==4);
}

static void testErrors()
{
  printf("----- errors\n");
  UnitConfig c;
  assert(throws([&]{ c.parse(json::parse(R"({"sync_stage": 3})")); }));
  assert(throws([&]{ c.parse(json::parse(R"({"sync_stages": 2})")); }));
  assert(throws([&]{ c.parse(json::parse(R"({"baud": -1})")); }));
  assert(throws([&]{ c.parse(json::parse(R"({"power_on": {"edge": "sideways"}})")); }));
  assert(throws([&]{ c.parse(json::parse(R"({"power_on": {"armed_mode": 2}})")); }));
  assert(throws([&]{ c.parse(json::parse(R"({"power_on": {"delay": 1}})")); }));
  assert(throws([&]{ c.parse(json::parse(R"({"power_on": {"coarse_delay": 4294967296}})")); }));
  assert(throws([&]{ c.parse(json::parse(R"([1,2])")); }));
  assert(throws([&]{ c.load("/nonexistent/tdu.json"); }));
}

static void testKwargs()
{
  printf("----- keyword arguments\n");
  std::map<std::string,std::string> kwargs;
  get_kwargs(" coarse_delay = 100, edge=falling,, fine_enabled=false ,tick_ns=1.25,device=/dev/ttyS0", kwargs);
  assert(kwargs.size()==5);
  assert(kwargs["coarse_delay"]=="100");
  assert(kwargs["edge"]=="falling");
  assert(kwargs["device"]=="/dev/ttyS0");
  assert(trim("  x y \t")=="x y");
  assert(trim(" \t ").empty());

  UnitConfig c;
  c.apply(kwargs);
  assert(c.unit.powerOn.coarseDelay==100);
  assert(c.unit.powerOn.edge==Core::EdgeFalling);
  assert(!c.fineEnabled && c.tickNs==1.25);
  assert(c.device=="/dev/ttyS0");

  std::map<std::string,std::string> bad;
  assert(throws([&]{ get_kwargs("loopback", bad); }));
  bad.clear();
  bad["sync_stages"] = "two";
  assert(throws([&]{ c.apply(bad); }));
}

static void testLoad()
{
  printf("----- load\n");
  char path[64];
  snprintf(path, sizeof(path), "/tmp/test_UnitConfig_%d.json", int(getpid()));
  {
    std::ofstream out(path);
    out << R"({"fine_step_ticks": 8, "power_on": {"output_width": 16}})";
  }
  UnitConfig c;
  c.load(path);
  unlink(path);
  assert(c.fineStepTicks==8 && c.unit.powerOn.outputWidth==16);
  c.dump();
}

static void testNames()
{
  printf("----- enumeration names\n");
  assert(edgeType(json("none"))==Core::EdgeNone);
  assert(edgeType(json(2))==Core::EdgeFalling);
  assert(triggerMode(json("external"))==Core::External);
  assert(armedMode(json("repeat"))==Core::Repeat);
  assert(throws([]{ edgeType(json(4)); }));
  assert(throws([]{ triggerMode(json(true)); }));
}

int main(int argc, char* argv[])
{
  testDefaults();
  testParse();
  testErrors();
  testKwargs();
  testLoad();
  testNames();
  printf("test_UnitConfig passed\n");
  return 0;
}
