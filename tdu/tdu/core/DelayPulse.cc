#include "tdu/core/DelayPulse.hh"

#include <stdio.h>

using namespace Tdu::Core;

DelayPulse::DelayPulse(const Config& cfg) :
  _cfg     (cfg),
  _state   (Idle),
  _count   (0),
  _width   (1),
  _pending (false),
  _output  (false),
  _rise    (false),
  _fall    (false),
  _triggers(0),
  _cycles  (0),
  _dropped (0)
{
}

void DelayPulse::_start()
{
  _cycles++;
  _width = _cfg.outputWidth ? _cfg.outputWidth : 1;
  if (_cfg.coarseDelay == 0) {
    _state  = OutputActive;
    _output = true;
    _count  = _width;
  }
  else {
    _state  = CountingDelay;
    _count  = _cfg.coarseDelay;
  }
}

void DelayPulse::_accept()
{
  if (_pending)
    _dropped++;
  else {
    _pending = true;
    _triggers++;
  }
}

void DelayPulse::tick(bool trigger)
{
  bool was = _output;

  switch(_state) {
  case Idle:
    if (trigger) {
      _triggers++;
      _start();
    }
    break;
  case CountingDelay:
    if (trigger)
      _accept();
    if (--_count == 0) {
      _state  = OutputActive;
      _output = true;
      _count  = _width;
    }
    break;
  case OutputActive:
    if (trigger)
      _accept();
    if (--_count == 0) {
      _output = false;
      _state  = Idle;
      if (_pending) {
        _pending = false;
        _start();
      }
    }
    break;
  }

  _rise = _output && !was;
  _fall = was && !_output;
}

void DelayPulse::dump() const
{
  static const char* states[] = {"Idle","CountingDelay","OutputActive"};
  printf("DelayPulse %s count %u width %u pending %u output %u\n",
         states[_state], _count, _width, _pending ? 1:0, _output ? 1:0);
  printf("\ttriggers %u  cycles %u  dropped %u\n",
         _triggers, _cycles, _dropped);
}
