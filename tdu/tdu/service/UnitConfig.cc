#include "tdu/service/UnitConfig.hh"
#include "tdu/service/SysLog.hh"

#include <stdio.h>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
using logging = Tdu::SysLog;

using namespace Tdu;

static const char* powerOnKeys[] = { "coarse_delay", "output_width", "edge",
                                     "trigger_mode", "armed_mode", "counter_mode",
                                     "edge_count_target", "soft_trigger_width", 0 };

static bool _bool(const json& v)
{
  if (v.is_boolean())
    return v.get<bool>();
  if (v.is_number_integer())
    return v.get<int64_t>() != 0;
  throw std::runtime_error("Expected a boolean, got "+v.dump());
}

static unsigned _unsigned(const json& v)
{
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0))
    throw std::runtime_error("Expected an unsigned integer, got "+v.dump());
  uint64_t u = v.get<uint64_t>();
  if (u > 0xffffffffULL)
    throw std::runtime_error("Value out of 32-bit range: "+v.dump());
  return unsigned(u);
}

//  Select a name from a table, or take its index
static unsigned _choice(const json& v, const char* const* names, unsigned n, const char* what)
{
  if (v.is_string()) {
    std::string s = v.get<std::string>();
    for(unsigned i=0; i<n; i++)
      if (s == names[i])
        return i;
  }
  else if (v.is_number_integer() && v.get<int64_t>() >= 0 && v.get<int64_t>() < int64_t(n))
    return unsigned(v.get<int64_t>());
  throw std::runtime_error(std::string("Invalid ")+what+": "+v.dump());
}

Core::EdgeType Tdu::edgeType(const json& v)
{
  static const char* names[] = {"none","rising","falling","both"};
  return Core::EdgeType(_choice(v, names, 4, "edge type"));
}

Core::TriggerMode Tdu::triggerMode(const json& v)
{
  static const char* names[] = {"external","internal"};
  return Core::TriggerMode(_choice(v, names, 2, "trigger mode"));
}

Core::ArmedMode Tdu::armedMode(const json& v)
{
  static const char* names[] = {"single","repeat"};
  return Core::ArmedMode(_choice(v, names, 2, "armed mode"));
}

UnitConfig::UnitConfig() :
  tickNs           (5.0),
  fineEnabled      (true),
  fineStepTicks    (12),
  fineStepsPerCycle(560),
  loopback         (false),
  baud             (1000000)
{
}

void UnitConfig::load(const std::string& path)
{
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error("Unable to open configuration file "+path);
  json j = json::parse(in);
  logging::debug("Loaded configuration %s", path.c_str());
  parse(j);
}

void UnitConfig::parse(const json& j)
{
  if (!j.is_object())
    throw std::runtime_error("Configuration must be a JSON object");

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    const json&        v   = it.value();
    if      (key == "sync_stages") {
      unsigned stages = _unsigned(v);
      if (stages < unsigned(Core::EdgeSync::MinStages))
        throw std::runtime_error("sync_stages must be at least 3");
      unit.syncStages = stages;
    }
    else if (key == "tick_ns")               tickNs              = v.get<double>();
    else if (key == "payload_timeout_ticks") unit.payloadTimeout = _unsigned(v);
    else if (key == "fine_timeout_ticks")    unit.fineTimeout    = _unsigned(v);
    else if (key == "fine_enabled")          fineEnabled         = _bool(v);
    else if (key == "fine_step_ticks")       fineStepTicks       = _unsigned(v);
    else if (key == "fine_steps_per_cycle")  fineStepsPerCycle   = _unsigned(v);
    else if (key == "loopback")              loopback            = _bool(v);
    else if (key == "device")                device              = v.get<std::string>();
    else if (key == "baud")                  baud                = _unsigned(v);
    else if (key == "power_on") {
      if (!v.is_object())
        throw std::runtime_error("power_on must be a JSON object");
      Core::Config& c = unit.powerOn;
      for (auto p = v.begin(); p != v.end(); ++p) {
        const std::string& k = p.key();
        if      (k == "coarse_delay")       c.coarseDelay      = _unsigned(p.value());
        else if (k == "output_width")       c.outputWidth      = _unsigned(p.value());
        else if (k == "edge")               c.edge             = edgeType(p.value());
        else if (k == "trigger_mode")       c.triggerMode      = triggerMode(p.value());
        else if (k == "armed_mode")         c.armedMode        = armedMode(p.value());
        else if (k == "counter_mode")       c.counterMode      = _bool(p.value());
        else if (k == "edge_count_target")  c.edgeCountTarget  = _unsigned(p.value());
        else if (k == "soft_trigger_width") c.softTriggerWidth = _unsigned(p.value());
        else
          throw std::runtime_error("Unrecognized power_on key '"+k+"'");
      }
    }
    else
      throw std::runtime_error("Unrecognized configuration key '"+key+"'");
  }
}

//
//  Keyword values are JSON literals where they parse as one (numbers,
//  true/false) and plain strings otherwise.  Power-on register names
//  may be given directly.
//
void UnitConfig::apply(const std::map<std::string,std::string>& kwargs)
{
  json top     = json::object();
  json powerOn = json::object();
  for (const auto& kwarg : kwargs) {
    json v = json::parse(kwarg.second, nullptr, false);
    if (v.is_discarded() || v.is_object() || v.is_array())
      v = kwarg.second;
    bool isPowerOn = false;
    for(const char* const* k = powerOnKeys; *k; k++)
      if (kwarg.first == *k)
        isPowerOn = true;
    if (isPowerOn)
      powerOn[kwarg.first] = v;
    else
      top[kwarg.first] = v;
  }
  if (!powerOn.empty())
    top["power_on"] = powerOn;
  parse(top);
}

void UnitConfig::dump() const
{
  printf("sync_stages           : %u\n", unit.syncStages);
  printf("tick_ns               : %g\n", tickNs);
  printf("payload_timeout_ticks : %u\n", unit.payloadTimeout);
  printf("fine_timeout_ticks    : %u\n", unit.fineTimeout);
  printf("fine                  : %s  step %u ticks  %u steps/cycle\n",
         fineEnabled ? "enabled":"disabled", fineStepTicks, fineStepsPerCycle);
  printf("loopback              : %s\n", loopback ? "on":"off");
  printf("device                : %s @ %u\n", device.empty() ? "<pty>" : device.c_str(), baud);
  printf("power_on:\n");
  unit.powerOn.dump();
}
