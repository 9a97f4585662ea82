#ifndef Tdu_Core_Registers_hh
#define Tdu_Core_Registers_hh

#include <stdint.h>

namespace Tdu {
  namespace Core {

    enum EdgeType    { EdgeNone=0, EdgeRising=1, EdgeFalling=2, EdgeBoth=3 };
    enum TriggerMode { External=0, Internal=1 };
    enum ArmedMode   { Single=0, Repeat=1 };

    //
    //  Configuration registers.  Written only by the command engine;
    //  every other component holds a const reference and reads it each tick.
    //  A value written during tick t is seen by the components from tick t+1.
    //
    class Config {
    public:
      Config() : coarseDelay     (0),
                 outputWidth     (1),
                 edge            (EdgeRising),
                 triggerMode     (External),
                 armedMode       (Single),
                 counterMode     (false),
                 edgeCountTarget (1),
                 softTriggerWidth(10) {}
    public:
      void dump() const;
    public:
      uint32_t    coarseDelay;      // ticks from trigger to pulse start
      uint32_t    outputWidth;      // ticks; 0 is treated as 1
      EdgeType    edge;
      TriggerMode triggerMode;
      ArmedMode   armedMode;
      bool        counterMode;
      uint32_t    edgeCountTarget;
      uint32_t    softTriggerWidth; // monitor pulse ticks; 0 is treated as 1
    };

    const char* name(EdgeType);
    const char* name(TriggerMode);
    const char* name(ArmedMode);
  };
};

#endif
