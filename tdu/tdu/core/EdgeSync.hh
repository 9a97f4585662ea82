#ifndef Tdu_Core_EdgeSync_hh
#define Tdu_Core_EdgeSync_hh

#include "tdu/core/Registers.hh"

#include <vector>

namespace Tdu {
  namespace Core {

    //
    //  Samples an asynchronous line through an N-stage pipeline (N>=3)
    //  and produces a one-tick pulse for each transition matching the
    //  selected edge type.  The edge type is read every tick.
    //
    class EdgeSync {
    public:
      enum { MinStages=3 };
      EdgeSync(const EdgeType& edge, unsigned stages=MinStages);
    public:
      void tick (bool raw);
      void reset();
      void dump () const;
    public:
      bool level() const { return _prev; }   // synchronized input
      bool edge () const { return _edge; }   // qualified transition, one tick
      bool rise () const { return _rise; }
      bool fall () const { return _fall; }
      unsigned stages() const { return _stage.size(); }
    private:
      const EdgeType&   _type;
      std::vector<bool> _stage;
      bool              _prev;
      bool              _rise;
      bool              _fall;
      bool              _edge;
    };
  };
};

#endif
