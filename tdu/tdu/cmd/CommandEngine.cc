#include "tdu/cmd/CommandEngine.hh"

#include "tdu/core/TriggerArbiter.hh"
#include "tdu/core/DelayPulse.hh"
#include "tdu/fine/FineChannel.hh"
#include "tdu/service/SysLog.hh"

#include <stdio.h>
#include <string.h>

using logging = Tdu::SysLog;

using namespace Tdu::Cmd;
using namespace Tdu::Core;

static inline uint32_t _get32(const uint8_t* p)
{
  return uint32_t(p[0]) | (uint32_t(p[1])<<8) | (uint32_t(p[2])<<16) | (uint32_t(p[3])<<24);
}

static inline uint8_t* _put16(uint8_t* p, uint16_t v)
{
  p[0] = v&0xff;
  p[1] = (v>>8)&0xff;
  return p+2;
}

static inline uint8_t* _put32(uint8_t* p, uint32_t v)
{
  for(unsigned i=0; i<4; i++)
    p[i] = (v>>(8*i))&0xff;
  return p+4;
}

CommandEngine::CommandEngine(Config&            config,
                             TriggerArbiter&    arbiter,
                             DelayPulse&        generator,
                             Fine::FineChannel* fineOffset,
                             Fine::FineChannel* fineWidth,
                             unsigned           payloadTimeout,
                             unsigned           fineTimeout) :
  m_config        (config),
  m_arbiter       (arbiter),
  m_generator     (generator),
  m_fineOffsetChan(fineOffset),
  m_fineWidthChan (fineWidth),
  m_payloadTimeout(payloadTimeout),
  m_fineTimeout   (fineTimeout),
  m_state         (Idle),
  m_handler       (0),
  m_opcode        (0),
  m_received      (0),
  m_idle          (0),
  m_responseSize  (0),
  m_sent          (0),
  m_waitChan      (0),
  m_waitLatch     (0),
  m_waited        (0),
  m_txValid       (false),
  m_txByte        (0),
  m_softTrigger   (false),
  m_fineOffset    (fineOffset ? fineOffset->value() : 0),
  m_fineWidth     (fineWidth  ? fineWidth ->value() : 0)
{
  memset(&m_counters, 0, sizeof(m_counters));
  memset(m_payload  , 0, sizeof(m_payload));
  memset(m_response , 0, sizeof(m_response));

  _add(SetCoarse     , 4, [this](const uint8_t* p) { m_config.coarseDelay = _get32(p); });
  _add(GetCoarse     , 0, [this](const uint8_t*)   { _respond32(m_config.coarseDelay); });
  _add(SetEdge       , 1, [this](const uint8_t* p) { m_config.edge = EdgeType(p[0]&3); });
  _add(GetEdge       , 0, [this](const uint8_t*)   { _respond8(m_config.edge); });
  _add(GetStatus     , 0, [this](const uint8_t*)   { _status(); });
  _add(ResetCount    , 0, [this](const uint8_t*)   { m_generator.resetCount(); });
  _add(SoftTrigger   , 0, [this](const uint8_t*)   { m_softTrigger = true; });
  _add(SetOutputWidth, 4, [this](const uint8_t* p) { m_config.outputWidth = _get32(p); });
  _add(GetOutputWidth, 0, [this](const uint8_t*)   { _respond32(m_config.outputWidth); });
  _add(SetTriggerMode, 1, [this](const uint8_t* p) { m_config.triggerMode = TriggerMode(p[0]&1); });
  _add(GetTriggerMode, 0, [this](const uint8_t*)   { _respond8(m_config.triggerMode); });
  _add(SetSoftTriggerWidth, 4, [this](const uint8_t* p) { m_config.softTriggerWidth = _get32(p); });
  _add(GetSoftTriggerWidth, 0, [this](const uint8_t*)   { _respond32(m_config.softTriggerWidth); });
  _add(SetCounterMode, 1, [this](const uint8_t* p) { m_config.counterMode = (p[0]&1); });
  _add(GetCounterMode, 0, [this](const uint8_t*)   { _respond8(m_config.counterMode ? 1:0); });
  _add(SetEdgeCountTarget, 4, [this](const uint8_t* p) { m_config.edgeCountTarget = _get32(p); });
  _add(GetEdgeCountTarget, 0, [this](const uint8_t*)   { _respond32(m_config.edgeCountTarget); });
  _add(ResetEdgeCount, 0, [this](const uint8_t*)   { m_arbiter.resetEdgeCount(); });
  _add(Arm           , 0, [this](const uint8_t*)   { m_arbiter.arm(); });
  _add(Disarm        , 0, [this](const uint8_t*)   { m_arbiter.disarm(); });
  _add(SetArmedMode  , 1, [this](const uint8_t* p) { m_config.armedMode = ArmedMode(p[0]&1); });
  _add(GetArmedMode  , 0, [this](const uint8_t*)   { _respond8(m_config.armedMode); });
  _add(GetArmed      , 0, [this](const uint8_t*)   { _respond8(m_arbiter.armed() ? 1:0); });
  _add(SetFineOffset , 4, [this](const uint8_t* p) { _setFine(m_fineOffsetChan, &m_fineOffset, p); });
  _add(GetFineOffset , 0, [this](const uint8_t*)   { _respond32(uint32_t(m_fineOffset)); });
  _add(SetFineWidth  , 4, [this](const uint8_t* p) { _setFine(m_fineWidthChan, &m_fineWidth, p); });
  _add(GetFineWidth  , 0, [this](const uint8_t*)   { _respond32(uint32_t(m_fineWidth)); });
}

void CommandEngine::_add(Opcode op, unsigned payload, Action action)
{
  Handler& h = m_handleMap[uint8_t(op)];
  h.payload = payload;
  h.action  = action;
}

void CommandEngine::tick(const uint8_t* rx, bool txReady)
{
  m_txValid     = false;
  m_softTrigger = false;

  switch(m_state) {
  case Idle:
    if (rx)
      _opcode(*rx);
    break;
  case Payload:
    if (rx) {
      m_payload[m_received++] = *rx;
      m_idle = 0;
      if (m_received == m_handler->payload)
        _execute();
    }
    else if (m_payloadTimeout && ++m_idle >= m_payloadTimeout) {
      logging::debug("Opcode 0x%02x: payload timeout after %u of %u bytes",
                     m_opcode, m_received, m_handler->payload);
      m_counters.payloadTimeouts++;
      m_state = Idle;
    }
    break;
  case Respond:
    if (txReady) {
      m_txValid = true;
      m_txByte  = m_response[m_sent++];
      if (m_sent == m_responseSize)
        m_state = Idle;
    }
    break;
  case Wait:
    if (m_waitChan->done()) {
      *m_waitLatch = m_waitChan->value();
      m_state = Idle;
    }
    else if (m_fineTimeout && ++m_waited >= m_fineTimeout) {
      logging::warning("Opcode 0x%02x: phase shifter did not acknowledge within %u ticks",
                       m_opcode, m_fineTimeout);
      m_waitChan->abort(*m_waitLatch);
      m_counters.fineTimeouts++;
      _respond8(FineTimeout);
    }
    break;
  }
}

void CommandEngine::_opcode(uint8_t op)
{
  auto it = m_handleMap.find(op);
  if (it == m_handleMap.end()) {
    logging::debug("Dropped unknown opcode 0x%02x", op);
    m_counters.droppedOpcodes++;
    return;
  }
  m_opcode   = op;
  m_handler  = &it->second;
  m_received = 0;
  m_idle     = 0;
  if (m_handler->payload)
    m_state = Payload;
  else
    _execute();
}

void CommandEngine::_execute()
{
  m_state = Idle;
  m_counters.commands++;
  m_handler->action(m_payload);
}

void CommandEngine::_respond8(uint8_t v)
{
  m_response[0]  = v;
  m_responseSize = 1;
  m_sent         = 0;
  m_state        = Respond;
}

void CommandEngine::_respond32(uint32_t v)
{
  _put32(m_response, v);
  m_responseSize = 4;
  m_sent         = 0;
  m_state        = Respond;
}

void CommandEngine::_status()
{
  bool locked = m_fineOffsetChan || m_fineWidthChan;
  bool ready  = true;
  if (m_fineOffsetChan) {
    locked &= m_fineOffsetChan->locked();
    ready  &= m_fineOffsetChan->ready();
  }
  if (m_fineWidthChan) {
    locked &= m_fineWidthChan->locked();
    ready  &= m_fineWidthChan->ready();
  }

  uint8_t* p = m_response;
  p = _put16(p, m_generator.triggers());
  p = _put32(p, m_config.coarseDelay);
  p = _put32(p, uint32_t(m_fineOffset));
  p = _put32(p, m_config.outputWidth);
  p = _put32(p, uint32_t(m_fineWidth));
  *p++ = m_arbiter.armed() ? 1:0;
  *p++ = m_config.triggerMode;
  *p++ = m_config.armedMode;
  *p++ = m_config.counterMode ? 1:0;
  *p++ = locked ? 1:0;
  *p++ = ready  ? 1:0;
  *p++ = m_config.edge;
  *p++ = 0;

  m_responseSize = p - m_response;
  m_sent         = 0;
  m_state        = Respond;
}

void CommandEngine::_setFine(Fine::FineChannel* chan, int32_t* latch, const uint8_t* p)
{
  int32_t target = int32_t(_get32(p));
  if (!chan) {
    *latch = target;
    return;
  }
  chan->request(target);
  m_waitChan  = chan;
  m_waitLatch = latch;
  m_waited    = 0;
  m_state     = Wait;
}

void CommandEngine::dump() const
{
  static const char* states[] = {"Idle","Payload","Respond","Wait"};
  printf("CommandEngine %s  fineOffset %d  fineWidth %d\n",
         states[m_state], m_fineOffset, m_fineWidth);
  printf("\tcommands %llu  dropped %llu  payloadTimeouts %llu  fineTimeouts %llu\n",
         (unsigned long long)m_counters.commands,
         (unsigned long long)m_counters.droppedOpcodes,
         (unsigned long long)m_counters.payloadTimeouts,
         (unsigned long long)m_counters.fineTimeouts);
}
