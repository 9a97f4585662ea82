#ifndef Tdu_Cmd_CommandEngine_hh
#define Tdu_Cmd_CommandEngine_hh

#include "tdu/cmd/Opcodes.hh"
#include "tdu/core/Registers.hh"

#include <stdint.h>
#include <functional>
#include <unordered_map>

namespace Tdu {
  namespace Core { class TriggerArbiter; class DelayPulse; }
  namespace Fine { class FineChannel; }

  namespace Cmd {

    struct Counters {
      uint64_t commands;          // dispatched requests
      uint64_t droppedOpcodes;    // unknown opcode bytes
      uint64_t payloadTimeouts;   // partial payloads discarded
      uint64_t fineTimeouts;      // phase shifter never acknowledged
    };

    //
    //  Byte-stream request/response dispatcher.  One request at a time:
    //  an opcode, then exactly the payload its handler declares.  SET
    //  handlers commit and return to Idle, GET handlers queue a response
    //  that is sent one byte per free transmit slot, fine SET handlers
    //  wait for the phase shifter and latch its position.  A fine SET that
    //  times out sends the shifter back to the latched position.
    //
    //  Unknown opcodes are dropped without a response.
    //
    //  The engine is the only writer of the configuration registers.
    //
    class CommandEngine {
    public:
      enum State { Idle, Payload, Respond, Wait };
      CommandEngine(Core::Config&         config,
                    Core::TriggerArbiter& arbiter,
                    Core::DelayPulse&     generator,
                    Fine::FineChannel*    fineOffset,
                    Fine::FineChannel*    fineWidth,
                    unsigned              payloadTimeout,
                    unsigned              fineTimeout);
      CommandEngine(const CommandEngine&) = delete;
      void operator = (const CommandEngine&) = delete;
    public:
      //  rx is null when no byte is offered; a byte may only be offered
      //  while rxReady() is true.
      void tick   (const uint8_t* rx, bool txReady);
      bool rxReady() const { return m_state==Idle || m_state==Payload; }
      void dump   () const;
    public:
      State           state      () const { return m_state; }
      bool            txValid    () const { return m_txValid; }
      uint8_t         txByte     () const { return m_txByte; }
      bool            softTrigger() const { return m_softTrigger; }  // one tick
      int32_t         fineOffset () const { return m_fineOffset; }
      int32_t         fineWidth  () const { return m_fineWidth; }
      const Counters& counters   () const { return m_counters; }
    private:
      typedef std::function<void(const uint8_t*)> Action;
      struct Handler {
        unsigned payload;
        Action   action;
      };
      void _add     (Opcode, unsigned payload, Action);
      void _opcode  (uint8_t);
      void _execute ();
      void _respond8 (uint8_t);
      void _respond32(uint32_t);
      void _status  ();
      void _setFine (Fine::FineChannel*, int32_t* latch, const uint8_t*);
    private:
      Core::Config&         m_config;
      Core::TriggerArbiter& m_arbiter;
      Core::DelayPulse&     m_generator;
      Fine::FineChannel*    m_fineOffsetChan;
      Fine::FineChannel*    m_fineWidthChan;
      unsigned              m_payloadTimeout;
      unsigned              m_fineTimeout;
      std::unordered_map<uint8_t, Handler> m_handleMap;

      State                 m_state;
      const Handler*        m_handler;
      uint8_t               m_opcode;
      uint8_t               m_payload [MaxPayload];
      unsigned              m_received;
      unsigned              m_idle;
      uint8_t               m_response[StatusSize];
      unsigned              m_responseSize;
      unsigned              m_sent;
      Fine::FineChannel*    m_waitChan;
      int32_t*              m_waitLatch;
      unsigned              m_waited;

      bool                  m_txValid;
      uint8_t               m_txByte;
      bool                  m_softTrigger;
      int32_t               m_fineOffset;
      int32_t               m_fineWidth;
      Counters              m_counters;
    };
  };
};

#endif
