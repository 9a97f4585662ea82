#include "tdu/fine/MmcmPhaseShifter.hh"

#include <stdio.h>

using namespace Tdu::Fine;

MmcmPhaseShifter::MmcmPhaseShifter(unsigned stepTicks,
                                   unsigned stepsPerCycle) :
  _stepTicks    (stepTicks ? stepTicks : 1),
  _stepsPerCycle(stepsPerCycle ? stepsPerCycle : 1),
  _target       (0),
  _current      (0),
  _timer        (0),
  _steps        (0),
  _busy         (false),
  _locked       (true)
{
}

void MmcmPhaseShifter::reset()
{
  _target  = 0;
  _current = 0;
  _timer   = 0;
  _busy    = false;
}

void MmcmPhaseShifter::configure(int32_t target)
{
  _target = target;
  _busy   = true;
  _timer  = _stepTicks;
}

void MmcmPhaseShifter::tick()
{
  if (!_locked || !_busy)
    return;
  if (--_timer)
    return;

  _timer = _stepTicks;
  if (_current < _target) {
    _current++;
    _steps++;
  }
  else if (_current > _target) {
    _current--;
    _steps++;
  }
  if (_current == _target)
    _busy = false;
}

unsigned MmcmPhaseShifter::phase() const
{
  int32_t n = int32_t(_stepsPerCycle);
  int32_t p = _current % n;
  return unsigned(p < 0 ? p+n : p);
}

void MmcmPhaseShifter::dump() const
{
  printf("MmcmPhaseShifter locked %u busy %u current %d target %d phase %u/%u steps %u\n",
         _locked ? 1:0, _busy ? 1:0, _current, _target,
         phase(), _stepsPerCycle, _steps);
}
