#ifndef Tdu_Cmd_Opcodes_hh
#define Tdu_Cmd_Opcodes_hh

namespace Tdu {
  namespace Cmd {

    //  Single-byte opcodes; multi-byte payloads and responses are little-endian
    enum Opcode {
      SetCoarse           = 0x01,  // u32 ->
      GetCoarse           = 0x02,  //     -> u32
      SetEdge             = 0x03,  // u8  ->
      GetEdge             = 0x04,  //     -> u8
      GetStatus           = 0x05,  //     -> StatusSize bytes
      ResetCount          = 0x06,
      SoftTrigger         = 0x07,
      SetOutputWidth      = 0x08,  // u32 ->
      GetOutputWidth      = 0x09,  //     -> u32
      SetTriggerMode      = 0x0A,  // u8  ->
      GetTriggerMode      = 0x0B,  //     -> u8
      SetSoftTriggerWidth = 0x0C,  // u32 ->
      GetSoftTriggerWidth = 0x0D,  //     -> u32
      SetCounterMode      = 0x0E,  // u8  ->
      GetCounterMode      = 0x0F,  //     -> u8
      SetEdgeCountTarget  = 0x10,  // u32 ->
      GetEdgeCountTarget  = 0x11,  //     -> u32
      ResetEdgeCount      = 0x12,
      Arm                 = 0x13,
      Disarm              = 0x14,
      SetArmedMode        = 0x15,  // u8  ->
      GetArmedMode        = 0x16,  //     -> u8
      GetArmed            = 0x17,  //     -> u8
      SetFineOffset       = 0x18,  // i32 ->  waits for the phase shifter
      GetFineOffset       = 0x19,  //     -> i32
      SetFineWidth        = 0x1A,  // i32 ->  waits for the phase shifter
      GetFineWidth        = 0x1B   //     -> i32
    };

    //
    //  GET_STATUS block
    //    [ 0: 1] trigger counter      u16
    //    [ 2: 5] coarse delay         u32
    //    [ 6: 9] fine offset          i32
    //    [10:13] output width         u32
    //    [14:17] fine width           i32
    //    [18]    armed
    //    [19]    trigger mode
    //    [20]    armed mode
    //    [21]    counter mode
    //    [22]    phase shifters locked
    //    [23]    phase shifters ready
    //    [24]    edge type
    //    [25]    reserved (0)
    //
    enum { StatusSize = 26 };

    //  Only response to a SET command: phase shifter did not acknowledge in time
    enum { FineTimeout = 0xEE };

    enum { MaxPayload = 4 };
  };
};

#endif
