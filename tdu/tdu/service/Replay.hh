#ifndef Tdu_Replay_hh
#define Tdu_Replay_hh

#include "tdu/core/Unit.hh"

#include <nlohmann/json.hpp>

#include <stdint.h>
#include <string>
#include <vector>

namespace Tdu {

  //
  //  Stimulus for a replay: the external input level from a given tick on,
  //  and/or bytes sent by the requester at a given tick.
  //
  class Trace {
  public:
    class Event {
    public:
      uint64_t             tick;
      int                  input;   // -1 leaves the level unchanged
      std::vector<uint8_t> tx;
    };
  public:
    Trace() : ticks(0) {}
    void load (const std::string& path);
    void parse(const nlohmann::json&);
  public:
    uint64_t           ticks;
    std::vector<Event> events;      // sorted by tick
  };

  //  One observed change on the unit's lines or one response byte
  class Record {
  public:
    enum Line { Output, Monitor, Rx };
    bool operator==(const Record& o) const
    { return tick==o.tick && line==o.line && value==o.value; }
  public:
    uint64_t tick;
    Line     line;
    unsigned value;
  };

  //
  //  Drives a unit with a trace.  Requester bytes are queued and offered
  //  one per tick while the unit is ready for them.  With loopback the
  //  monitor line of the previous tick is ORed onto the input.
  //
  class Replay {
  public:
    Replay(Core::Unit& unit, bool loopback);
  public:
    void run  (const Trace&, std::vector<Record>& records);
    static void print(const std::vector<Record>&, double tickNs);
    static nlohmann::json toJson(const std::vector<Record>&);
  private:
    Core::Unit& m_unit;
    bool        m_loopback;
  };
};

#endif
