#include "tdu/core/EdgeSync.hh"

#include <stdio.h>

using namespace Tdu::Core;

EdgeSync::EdgeSync(const EdgeType& edge, unsigned stages) :
  _type (edge),
  _stage(stages < unsigned(MinStages) ? unsigned(MinStages) : stages, false)
{
  reset();
}

void EdgeSync::reset()
{
  for(unsigned i=0; i<_stage.size(); i++)
    _stage[i] = false;
  _prev = _rise = _fall = _edge = false;
}

void EdgeSync::tick(bool raw)
{
  for(unsigned i=_stage.size()-1; i>0; i--)
    _stage[i] = _stage[i-1];
  _stage[0] = raw;

  bool v = _stage.back();
  _rise = v && !_prev;
  _fall = !v && _prev;
  _prev = v;

  switch(_type) {
  case EdgeRising : _edge = _rise; break;
  case EdgeFalling: _edge = _fall; break;
  case EdgeBoth   : _edge = _rise || _fall; break;
  default         : _edge = false; break;
  }
}

void EdgeSync::dump() const
{
  printf("EdgeSync [%s] stages %zu :", name(_type), _stage.size());
  for(unsigned i=0; i<_stage.size(); i++)
    printf(" %u", _stage[i] ? 1:0);
  printf(" | level %u edge %u\n", _prev ? 1:0, _edge ? 1:0);
}
