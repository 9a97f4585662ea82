#ifndef Tdu_Fine_PulseSync_hh
#define Tdu_Fine_PulseSync_hh

#include "tdu/core/EdgeSync.hh"

namespace Tdu {
  namespace Fine {

    //
    //  Carries one-tick pulses into another clock domain.  Each source
    //  pulse flips a toggle level; the destination runs the toggle through
    //  the N-stage synchronizer and emits a pulse on either transition.
    //
    class PulseSync {
    public:
      PulseSync(unsigned stages);
    public:
      void send (bool pulse) { if (pulse) _toggle = !_toggle; }  // source domain
      void tick ()           { _sync.tick(_toggle); }            // destination domain
      bool pulse() const     { return _sync.edge(); }
    private:
      static const Core::EdgeType _both;
      bool           _toggle;
      Core::EdgeSync _sync;
    };
  };
};

#endif
