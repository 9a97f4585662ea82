#include "tdu/fine/PulseSync.hh"

using namespace Tdu::Fine;

const Tdu::Core::EdgeType PulseSync::_both = Tdu::Core::EdgeBoth;

PulseSync::PulseSync(unsigned stages) :
  _toggle(false),
  _sync  (_both, stages)
{
}
