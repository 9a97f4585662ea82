#ifndef Tdu_Core_TriggerArbiter_hh
#define Tdu_Core_TriggerArbiter_hh

#include "tdu/core/Registers.hh"

namespace Tdu {
  namespace Core {

    //
    //  Selects the trigger source, applies Nth-edge counting and gates
    //  the result with the armed state.  Single-shot mode disarms on the
    //  tick a trigger is forwarded.  Edges are only counted while armed.
    //
    class TriggerArbiter {
    public:
      TriggerArbiter(const Config&);
    public:
      void tick          (bool edge, bool soft);
      void arm           () { _armed = true; }
      void disarm        () { _armed = false; }
      void resetEdgeCount() { _edgeCount = 0; }
      void dump          () const;
    public:
      bool     trigger  () const { return _trigger; }   // forwarded, one tick
      bool     armed    () const { return _armed; }
      uint32_t edgeCount() const { return _edgeCount; }
      unsigned forwarded() const { return _forwarded; }
    private:
      const Config& _cfg;
      bool          _armed;
      bool          _trigger;
      uint32_t      _edgeCount;
      unsigned      _forwarded;
    };
  };
};

#endif
