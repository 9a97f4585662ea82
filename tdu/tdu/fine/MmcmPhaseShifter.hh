#ifndef Tdu_Fine_MmcmPhaseShifter_hh
#define Tdu_Fine_MmcmPhaseShifter_hh

#include "tdu/fine/PhaseShifter.hh"

namespace Tdu {
  namespace Fine {

    //
    //  Behavioural model of an MMCM dynamic phase shift port.  Each
    //  adjustment moves the phase by one step toward the target and takes
    //  stepTicks periods to complete.  An accepted request keeps the port
    //  busy for at least one adjustment period, even when no step is needed.
    //
    class MmcmPhaseShifter : public PhaseShifter {
    public:
      MmcmPhaseShifter(unsigned stepTicks=12, unsigned stepsPerCycle=560);
    public:
      void    configure (int32_t target) override;
      bool    configured() const override { return _locked && !_busy; }
      bool    locked    () const override { return _locked; }
      int32_t current   () const override { return _current; }
      void    tick      () override;
    public:
      void     lock (bool v) { _locked = v; }
      void     reset();
      int32_t  target() const { return _target; }
      unsigned steps () const { return _steps; }
      unsigned phase () const;
      void     dump  () const;
    private:
      unsigned _stepTicks;
      unsigned _stepsPerCycle;
      int32_t  _target;
      int32_t  _current;
      unsigned _timer;
      unsigned _steps;
      bool     _busy;
      bool     _locked;
    };
  };
};

#endif
