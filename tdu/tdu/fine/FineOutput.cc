#include "tdu/fine/FineOutput.hh"

using namespace Tdu::Fine;

FineOutput::FineOutput(unsigned stages) :
  _set  (stages),
  _reset(stages),
  _level(false)
{
}

void FineOutput::tick(bool set, bool reset)
{
  _set  .send(set);
  _reset.send(reset);
  _set  .tick();
  _reset.tick();
  if (_reset.pulse())
    _level = false;
  if (_set.pulse())
    _level = true;
}
