#ifndef Tdu_Fine_PhaseShifter_hh
#define Tdu_Fine_PhaseShifter_hh

#include <stdint.h>

namespace Tdu {
  namespace Fine {

    //
    //  Sub-tick edge positioning service.  Runs in its own clock domain;
    //  tick() advances that domain by one of its periods.
    //
    //  configure() is fire-and-forget.  configured() drops when a request
    //  is accepted and is asserted again once current() has reached the
    //  requested target.
    //
    class PhaseShifter {
    public:
      virtual ~PhaseShifter() {}
    public:
      virtual void    configure (int32_t target) = 0;
      virtual bool    configured() const = 0;
      virtual bool    locked    () const = 0;
      virtual int32_t current   () const = 0;
      virtual void    tick      () = 0;
    };
  };
};

#endif
