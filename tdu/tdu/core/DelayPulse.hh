#ifndef Tdu_Core_DelayPulse_hh
#define Tdu_Core_DelayPulse_hh

#include "tdu/core/Registers.hh"

namespace Tdu {
  namespace Core {

    //
    //  Turns one trigger pulse into one output pulse that starts
    //  coarseDelay ticks after the trigger and stays active for
    //  outputWidth ticks.  Delay and width are latched when a cycle
    //  starts; later register writes only affect the next cycle.
    //
    //  A trigger that arrives while a cycle is in flight is held in a
    //  single pending slot and starts a new cycle the tick the current
    //  one completes.  A trigger that arrives while the slot is already
    //  full is dropped.  The slot never holds more than one trigger.
    //
    //  The trigger counter counts accepted triggers (cycle starts plus
    //  pending latches) and wraps at 16 bits.
    //
    class DelayPulse {
    public:
      enum State { Idle, CountingDelay, OutputActive };
      DelayPulse(const Config&);
    public:
      void tick      (bool trigger);
      void resetCount() { _triggers = 0; }
      void dump      () const;
    public:
      State    state   () const { return _state; }
      bool     output  () const { return _output; }
      bool     rise    () const { return _rise; }    // output set, one tick
      bool     fall    () const { return _fall; }    // output reset, one tick
      bool     pending () const { return _pending; }
      uint16_t triggers() const { return _triggers; }
      unsigned cycles  () const { return _cycles; }
      unsigned dropped () const { return _dropped; }
    private:
      void _start ();
      void _accept();
    private:
      const Config& _cfg;
      State         _state;
      uint32_t      _count;
      uint32_t      _width;
      bool          _pending;
      bool          _output;
      bool          _rise;
      bool          _fall;
      uint16_t      _triggers;
      unsigned      _cycles;
      unsigned      _dropped;
    };
  };
};

#endif
