#ifndef Tdu_UnitConfig_hh
#define Tdu_UnitConfig_hh

#include "tdu/core/Unit.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace Tdu {

  //
  //  Application settings: the unit's construction parameters and
  //  power-on registers, the simulated phase shifters and the serial link.
  //  Filled from a JSON file and/or -k keyword arguments; unknown keys and
  //  out-of-range values throw.
  //
  class UnitConfig {
  public:
    UnitConfig();
  public:
    void load (const std::string& path);
    void parse(const nlohmann::json&);
    void apply(const std::map<std::string,std::string>& kwargs);
    void dump () const;
  public:
    Core::Unit::Params unit;
    double             tickNs;
    bool               fineEnabled;
    unsigned           fineStepTicks;
    unsigned           fineStepsPerCycle;
    bool               loopback;
    std::string        device;
    unsigned           baud;
  };

  Core::EdgeType    edgeType   (const nlohmann::json&);
  Core::TriggerMode triggerMode(const nlohmann::json&);
  Core::ArmedMode   armedMode  (const nlohmann::json&);
};

#endif
