#ifdef NDEBUG
#undef NDEBUG
#endif

#include "tdu/fine/FineChannel.hh"
#include "tdu/fine/FineOutput.hh"
#include "tdu/fine/MmcmPhaseShifter.hh"
#include "tdu/fine/PulseSync.hh"

#include <assert.h>
#include <stdio.h>

using namespace Tdu::Fine;

//  Ticks until done, 0 if not within n
static unsigned complete(FineChannel& c, unsigned n)
{
  for(unsigned i=1; i<=n; i++) {
    c.tick();
    if (c.done())
      return i;
  }
  return 0;
}

static void testHandshake()
{
  printf("----- handshake\n");
  MmcmPhaseShifter s(3);
  FineChannel c(s, 3);
  for(unsigned i=0; i<5; i++)
    c.tick();
  assert(c.locked() && c.ready() && !c.busy());

  c.request(5);
  assert(c.busy());
  unsigned n = complete(c, 1000);
  printf("  5 steps acknowledged after %u ticks\n", n);
  assert(n > 5*3);
  assert(!c.busy() && c.value()==5);
  assert(s.current()==5 && s.steps()==5);
  c.tick();
  assert(!c.done());

  c.request(-2);
  assert(complete(c, 1000));
  assert(c.value()==-2 && s.steps()==12);
  assert(s.phase()==558);
}

static void testSameTarget()
{
  printf("----- request for the current position\n");
  MmcmPhaseShifter s(1);
  FineChannel c(s, 3);
  for(unsigned i=0; i<5; i++)
    c.tick();
  c.request(0);
  assert(complete(c, 100));
  assert(c.value()==0 && s.steps()==0);
}

static void testAbort()
{
  printf("----- unlocked shifter never acknowledges\n");
  MmcmPhaseShifter s(2);
  s.lock(false);
  FineChannel c(s, 3);
  for(unsigned i=0; i<5; i++)
    c.tick();
  assert(!c.locked() && !c.ready());

  c.request(3);
  assert(complete(c, 500)==0);
  assert(c.busy() && s.target()==3);
  c.abort(0);
  assert(c.busy());

  //  the restore is the request that completes on relock
  s.lock(true);
  assert(complete(c, 100));
  assert(!c.busy());
  assert(c.value()==0 && s.current()==0 && s.target()==0);
  for(unsigned i=0; i<50; i++)
    c.tick();
  assert(s.current()==0);

  c.request(-1);
  assert(complete(c, 500));
  assert(c.value()==-1 && c.locked());
}

static void testAbortMoving()
{
  printf("----- abort while the shifter is moving\n");
  MmcmPhaseShifter s(4);
  FineChannel c(s, 3);
  for(unsigned i=0; i<5; i++)
    c.tick();

  c.request(100);
  for(unsigned i=0; i<200; i++) {
    c.tick();
    assert(!c.done());
  }
  assert(s.current()>0 && s.current()<100);

  c.abort(0);
  unsigned n = complete(c, 2000);
  printf("  returned after %u ticks\n", n);
  assert(n);
  assert(c.value()==0 && s.current()==0 && !c.busy());
  for(unsigned i=0; i<1000; i++)
    c.tick();
  assert(s.current()==0 && s.target()==0);
}

static void testPulseSync()
{
  printf("----- pulse synchronizer\n");
  PulseSync p(3);
  unsigned pulses=0;
  for(unsigned t=0; t<40; t++) {
    p.send(t==0 || t==1 || t==20);
    p.tick();
    if (p.pulse()) pulses++;
  }
  assert(pulses==3);
}

static void testFineOutput()
{
  printf("----- fine output keeps the width\n");
  FineOutput o(3);
  unsigned high=0, first=0;
  for(unsigned t=0; t<20; t++) {
    o.tick(t==0, t==4);
    if (o.level()) {
      if (!high) first = t;
      high++;
    }
  }
  assert(high==4 && first==2);
}

int main(int argc, char* argv[])
{
  testHandshake();
  testSameTarget();
  testAbort();
  testAbortMoving();
  testPulseSync();
  testFineOutput();
  printf("test_FineChannel passed\n");
  return 0;
}
