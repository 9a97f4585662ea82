#ifdef NDEBUG
#undef NDEBUG
#endif

#include "tdu/core/EdgeSync.hh"

#include <assert.h>
#include <stdio.h>

using namespace Tdu::Core;

//  Ticks until the first edge pulse, 0 if none within n ticks
static unsigned latency(EdgeSync& s, bool raw, unsigned n)
{
  for(unsigned i=1; i<=n; i++) {
    s.tick(raw);
    if (s.edge())
      return i;
  }
  return 0;
}

static void testRising()
{
  printf("----- rising\n");
  EdgeType type = EdgeRising;
  EdgeSync s(type);
  assert(s.stages()==3);
  assert(latency(s, true, 10)==3);
  assert(s.level() && s.rise());
  s.tick(true);
  assert(!s.edge());                  // one tick only
  assert(latency(s, false, 10)==0);   // falling ignored
  assert(!s.level());
}

static void testFalling()
{
  printf("----- falling\n");
  EdgeType type = EdgeFalling;
  EdgeSync s(type);
  assert(latency(s, true, 10)==0);
  assert(latency(s, false, 10)==3);
  assert(s.fall() && !s.rise());
}

static void testBoth()
{
  printf("----- both\n");
  EdgeType type = EdgeBoth;
  EdgeSync s(type);
  assert(latency(s, true , 10)==3);
  assert(latency(s, false, 10)==3);
}

static void testNone()
{
  printf("----- none\n");
  EdgeType type = EdgeNone;
  EdgeSync s(type);
  for(unsigned i=0; i<5; i++) {
    assert(latency(s, true , 10)==0);
    assert(latency(s, false, 10)==0);
  }
  //  transitions are still tracked
  s.tick(true); s.tick(true); s.tick(true);
  assert(s.rise() && !s.edge());
}

static void testStages()
{
  printf("----- stages\n");
  EdgeType type = EdgeRising;
  EdgeSync s2(type, 1);
  assert(s2.stages()==3);
  EdgeSync s5(type, 5);
  assert(s5.stages()==5);
  assert(latency(s5, true, 10)==5);
}

static void testTypeChange()
{
  printf("----- edge type read every tick\n");
  EdgeType type = EdgeRising;
  EdgeSync s(type);
  assert(latency(s, true, 10)==3);
  type = EdgeFalling;
  assert(latency(s, false, 10)==3);
  type = EdgeNone;
  assert(latency(s, true, 10)==0);
}

static void testReset()
{
  printf("----- reset\n");
  EdgeType type = EdgeRising;
  EdgeSync s(type);
  s.tick(true); s.tick(true);
  s.reset();
  assert(!s.level() && !s.edge());
  assert(latency(s, true, 10)==3);
}

int main(int argc, char* argv[])
{
  testRising();
  testFalling();
  testBoth();
  testNone();
  testStages();
  testTypeChange();
  testReset();
  printf("test_EdgeSync passed\n");
  return 0;
}
