#ifndef Tdu_Core_Unit_hh
#define Tdu_Core_Unit_hh

#include "tdu/core/Registers.hh"
#include "tdu/core/EdgeSync.hh"
#include "tdu/core/TriggerArbiter.hh"
#include "tdu/core/DelayPulse.hh"
#include "tdu/cmd/CommandEngine.hh"

#include <stdint.h>
#include <memory>

namespace Tdu {
  namespace Fine { class PhaseShifter; class FineChannel; class FineOutput; }

  namespace Core {

    //
    //  The trigger delay unit, advanced one tick at a time.
    //
    //  Every component computes its next state from the previous tick's
    //  outputs of the others, so the order of the updates inside tick()
    //  does not matter and identical input traces give identical outputs.
    //
    //  The phase shifters are optional and not owned.  When present the
    //  output pulse is formed in their domain from the generator's set and
    //  reset pulses.
    //
    class Unit {
    public:
      struct Params {
        Params() : syncStages(EdgeSync::MinStages),
                   payloadTimeout(1000000),
                   fineTimeout(1<<24) {}
        Config   powerOn;
        unsigned syncStages;
        unsigned payloadTimeout;   // ticks, 0 disables
        unsigned fineTimeout;      // ticks, 0 waits forever
      };
      Unit(const Params&,
           Fine::PhaseShifter* fineOffset=0,
           Fine::PhaseShifter* fineWidth =0);
      ~Unit();
    public:
      //  rx is offered only while rxReady(); it is consumed by that tick
      void tick   (bool input, const uint8_t* rx=0, bool txReady=true);
      bool rxReady() const { return _cmd.rxReady(); }
      void dump   () const;
    public:
      bool     output () const;                       // delayed pulse
      bool     monitor() const { return _monitor>0; } // soft trigger loopback line
      bool     txValid() const { return _cmd.txValid(); }
      uint8_t  txByte () const { return _cmd.txByte(); }
      uint64_t ticks  () const { return _ticks; }
    public:
      const Config&             config   () const { return _config; }
      const EdgeSync&           sync     () const { return _sync; }
      const TriggerArbiter&     arbiter  () const { return _arbiter; }
      const DelayPulse&         generator() const { return _generator; }
      const Cmd::CommandEngine& command  () const { return _cmd; }
    private:
      Config                             _config;
      EdgeSync                           _sync;
      TriggerArbiter                     _arbiter;
      DelayPulse                         _generator;
      std::unique_ptr<Fine::FineChannel> _fineOffset;
      std::unique_ptr<Fine::FineChannel> _fineWidth;
      std::unique_ptr<Fine::FineOutput>  _fineOutput;
      Cmd::CommandEngine                 _cmd;
      uint32_t                           _monitor;
      uint64_t                           _ticks;
    };
  };
};

#endif
