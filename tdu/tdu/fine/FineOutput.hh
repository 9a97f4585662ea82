#ifndef Tdu_Fine_FineOutput_hh
#define Tdu_Fine_FineOutput_hh

#include "tdu/fine/PulseSync.hh"

namespace Tdu {
  namespace Fine {

    //
    //  Output flip-flop in the phase shifted domain.  The generator's set
    //  and reset pulses cross the boundary through matching synchronizers,
    //  so the pulse width is preserved and only a fixed latency is added.
    //
    class FineOutput {
    public:
      FineOutput(unsigned stages);
    public:
      void tick (bool set, bool reset);
      bool level() const { return _level; }
    private:
      PulseSync _set;
      PulseSync _reset;
      bool      _level;
    };
  };
};

#endif
