#ifdef NDEBUG
#undef NDEBUG
#endif

#include "tdu/core/TriggerArbiter.hh"

#include <assert.h>
#include <stdio.h>

using namespace Tdu::Core;

static void testDisarmed()
{
  printf("----- disarmed forwards nothing\n");
  Config cfg;
  TriggerArbiter a(cfg);
  a.tick(true, true);
  assert(!a.trigger());
  cfg.triggerMode = Internal;
  a.tick(true, true);
  assert(!a.trigger() && a.forwarded()==0);
}

static void testArmIdempotent()
{
  printf("----- arm and disarm are idempotent\n");
  Config cfg;
  TriggerArbiter a(cfg);
  a.arm(); a.arm();
  assert(a.armed());
  a.disarm(); a.disarm();
  assert(!a.armed());
}

static void testSingle()
{
  printf("----- single shot\n");
  Config cfg;
  cfg.armedMode = Single;
  TriggerArbiter a(cfg);
  a.arm();
  a.tick(false, false);
  assert(!a.trigger() && a.armed());
  a.tick(true, false);
  assert(a.trigger() && !a.armed());
  a.tick(true, false);
  assert(!a.trigger());
  assert(a.forwarded()==1);
}

static void testRepeat()
{
  printf("----- repeat\n");
  Config cfg;
  cfg.armedMode = Repeat;
  TriggerArbiter a(cfg);
  a.arm();
  for(unsigned i=0; i<5; i++) {
    a.tick(true, false);
    assert(a.trigger() && a.armed());
    a.tick(false, false);
    assert(!a.trigger());
  }
  assert(a.forwarded()==5);
}

static void testSource()
{
  printf("----- source selection\n");
  Config cfg;
  cfg.armedMode = Repeat;
  TriggerArbiter a(cfg);
  a.arm();
  cfg.triggerMode = External;
  a.tick(false, true);
  assert(!a.trigger());
  cfg.triggerMode = Internal;
  a.tick(true, false);
  assert(!a.trigger());
  a.tick(false, true);
  assert(a.trigger());
}

static void testCounter()
{
  printf("----- every third edge\n");
  Config cfg;
  cfg.armedMode       = Repeat;
  cfg.counterMode     = true;
  cfg.edgeCountTarget = 3;
  TriggerArbiter a(cfg);

  //  not counted while disarmed
  a.tick(true, false);
  a.tick(true, false);
  assert(a.edgeCount()==0);

  a.arm();
  unsigned forwarded=0;
  for(unsigned i=1; i<=9; i++) {
    a.tick(true, false);
    if (a.trigger()) forwarded++;
    assert(a.trigger() == (i%3==0));
    assert(a.edgeCount() == i%3);
    a.tick(false, false);
    assert(!a.trigger());
  }
  assert(forwarded==3);

  a.tick(true, false);
  assert(a.edgeCount()==1);
  a.resetEdgeCount();
  assert(a.edgeCount()==0);
}

static void testCounterSmallTarget()
{
  printf("----- targets 0 and 1 forward every edge\n");
  Config cfg;
  cfg.armedMode   = Repeat;
  cfg.counterMode = true;
  TriggerArbiter a(cfg);
  a.arm();
  cfg.edgeCountTarget = 0;
  a.tick(true, false);
  assert(a.trigger());
  cfg.edgeCountTarget = 1;
  a.tick(true, false);
  assert(a.trigger() && a.edgeCount()==0);
}

static void testCounterSingle()
{
  printf("----- counter with single shot\n");
  Config cfg;
  cfg.armedMode       = Single;
  cfg.counterMode     = true;
  cfg.edgeCountTarget = 3;
  TriggerArbiter a(cfg);
  a.arm();
  a.tick(true, false);
  a.tick(true, false);
  assert(a.armed() && !a.trigger());
  a.tick(true, false);
  assert(a.trigger() && !a.armed());
  a.tick(true, false);
  assert(!a.trigger() && a.edgeCount()==0);
}

static void testInternalIgnoresCounter()
{
  printf("----- counter applies to the external source only\n");
  Config cfg;
  cfg.armedMode       = Repeat;
  cfg.triggerMode     = Internal;
  cfg.counterMode     = true;
  cfg.edgeCountTarget = 5;
  TriggerArbiter a(cfg);
  a.arm();
  a.tick(false, true);
  assert(a.trigger());
}

int main(int argc, char* argv[])
{
  testDisarmed();
  testArmIdempotent();
  testSingle();
  testRepeat();
  testSource();
  testCounter();
  testCounterSmallTarget();
  testCounterSingle();
  testInternalIgnoresCounter();
  printf("test_TriggerArbiter passed\n");
  return 0;
}
