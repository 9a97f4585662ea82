#include "tdu/service/Replay.hh"
#include "tdu/service/SysLog.hh"

#include <stdio.h>
#include <algorithm>
#include <deque>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
using logging = Tdu::SysLog;

using namespace Tdu;

void Trace::load(const std::string& path)
{
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error("Unable to open trace file "+path);
  parse(json::parse(in));
}

void Trace::parse(const json& j)
{
  ticks = j.at("ticks").get<uint64_t>();
  events.clear();
  if (j.contains("events")) {
    for (const auto& e : j.at("events")) {
      Event ev;
      ev.tick  = e.at("tick").get<uint64_t>();
      ev.input = e.contains("input") ? (e.at("input").get<int>() ? 1:0) : -1;
      if (e.contains("tx"))
        for (const auto& b : e.at("tx")) {
          unsigned v = b.get<unsigned>();
          if (v > 0xff)
            throw std::runtime_error("Trace byte out of range: "+b.dump());
          ev.tx.push_back(uint8_t(v));
        }
      events.push_back(ev);
    }
  }
  std::stable_sort(events.begin(), events.end(),
                   [](const Event& a, const Event& b) { return a.tick < b.tick; });
  logging::debug("Trace: %zu events over %llu ticks",
                 events.size(), (unsigned long long)ticks);
}

Replay::Replay(Core::Unit& unit, bool loopback) :
  m_unit    (unit),
  m_loopback(loopback)
{
}

void Replay::run(const Trace& trace, std::vector<Record>& records)
{
  std::deque<uint8_t> txq;
  bool     input   = false;
  bool     output  = m_unit.output();
  bool     monitor = m_unit.monitor();
  unsigned next    = 0;

  for(uint64_t t=0; t<trace.ticks; t++) {
    while (next < trace.events.size() && trace.events[next].tick == t) {
      const Trace::Event& ev = trace.events[next++];
      if (ev.input >= 0)
        input = ev.input;
      txq.insert(txq.end(), ev.tx.begin(), ev.tx.end());
    }
    while (next < trace.events.size() && trace.events[next].tick < t)
      next++;

    const uint8_t* rx = 0;
    uint8_t byte = 0;
    if (!txq.empty() && m_unit.rxReady()) {
      byte = txq.front();
      txq.pop_front();
      rx = &byte;
    }

    bool line = input || (m_loopback && m_unit.monitor());
    m_unit.tick(line, rx);

    uint64_t now = m_unit.ticks()-1;
    if (m_unit.output() != output) {
      output = m_unit.output();
      records.push_back(Record{now, Record::Output, output ? 1U:0U});
    }
    if (m_unit.monitor() != monitor) {
      monitor = m_unit.monitor();
      records.push_back(Record{now, Record::Monitor, monitor ? 1U:0U});
    }
    if (m_unit.txValid())
      records.push_back(Record{now, Record::Rx, m_unit.txByte()});
  }

  if (!txq.empty())
    logging::warning("Replay ended with %zu requester bytes not consumed", txq.size());
}

void Replay::print(const std::vector<Record>& records, double tickNs)
{
  static const char* lines[] = {"output","monitor","rx"};
  for (const auto& r : records) {
    if (r.line == Record::Rx)
      printf("%10llu %12.1f ns  %-7s 0x%02x\n",
             (unsigned long long)r.tick, double(r.tick)*tickNs, lines[r.line], r.value);
    else
      printf("%10llu %12.1f ns  %-7s %u\n",
             (unsigned long long)r.tick, double(r.tick)*tickNs, lines[r.line], r.value);
  }
}

json Replay::toJson(const std::vector<Record>& records)
{
  static const char* lines[] = {"output","monitor","rx"};
  json j = json::array();
  for (const auto& r : records)
    j.push_back({{"tick", r.tick}, {"line", lines[r.line]}, {"value", r.value}});
  return j;
}
