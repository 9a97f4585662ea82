#ifndef Tdu_Fine_FineChannel_hh
#define Tdu_Fine_FineChannel_hh

#include "tdu/core/EdgeSync.hh"
#include "tdu/fine/PhaseShifter.hh"

namespace Tdu {
  namespace Fine {

    //
    //  Request/acknowledge handshake with a PhaseShifter.
    //
    //  request() raises a request level that is held until the shifter
    //  acknowledges.  The level is synchronized into the shifter's domain
    //  and its rising edge issues exactly one configure().  The shifter's
    //  configured() level is synchronized back; the request completes on
    //  its rising edge after it was seen low, so a level that was already
    //  high never acknowledges a new request.
    //
    //  The request is raised only once the shifter domain has seen the
    //  line low.  abort() replaces the outstanding request with one that
    //  returns the shifter to the given position.
    //
    class FineChannel {
    public:
      FineChannel(PhaseShifter& shifter, unsigned stages);
    public:
      void request(int32_t target);
      void abort  (int32_t restore);
      void tick   ();                                // both domains, one step
    public:
      bool    busy  () const { return _pending || _req; }
      bool    done  () const { return _done; }       // one tick on acknowledge
      int32_t value () const { return _value; }      // shifter position at acknowledge
      bool    locked() const { return _lockSync.level(); }
      bool    ready () const { return _ackSync.level(); }
    private:
      static const Core::EdgeType _rising;
      PhaseShifter&  _shifter;
      int32_t        _target;
      int32_t        _value;
      bool           _pending;   // waiting for the line to be seen low
      bool           _req;
      bool           _issued;
      bool           _sawBusy;
      bool           _done;
      Core::EdgeSync _reqSync;   // tick domain -> shifter domain
      Core::EdgeSync _ackSync;   // shifter domain -> tick domain
      Core::EdgeSync _lockSync;
    };
  };
};

#endif
