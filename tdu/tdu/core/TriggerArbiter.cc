#include "tdu/core/TriggerArbiter.hh"

#include <stdio.h>

using namespace Tdu::Core;

TriggerArbiter::TriggerArbiter(const Config& cfg) :
  _cfg      (cfg),
  _armed    (false),
  _trigger  (false),
  _edgeCount(0),
  _forwarded(0)
{
}

void TriggerArbiter::tick(bool edge, bool soft)
{
  bool selected = false;

  if (_cfg.triggerMode == Internal)
    selected = soft;
  else if (!_cfg.counterMode)
    selected = edge;
  else if (edge && _armed) {
    if (_edgeCount+1 >= _cfg.edgeCountTarget) {
      selected   = true;
      _edgeCount = 0;
    }
    else
      _edgeCount++;
  }

  _trigger = selected && _armed;
  if (_trigger) {
    _forwarded++;
    if (_cfg.armedMode == Single)
      _armed = false;
  }
}

void TriggerArbiter::dump() const
{
  printf("TriggerArbiter armed %u [%s]  source %s%s  edgeCount %u/%u  forwarded %u\n",
         _armed ? 1:0, name(_cfg.armedMode),
         name(_cfg.triggerMode), _cfg.counterMode ? "+counter":"",
         _edgeCount, _cfg.edgeCountTarget, _forwarded);
}
