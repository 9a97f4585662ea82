#include "tdu/core/Unit.hh"

#include "tdu/fine/PhaseShifter.hh"
#include "tdu/fine/FineChannel.hh"
#include "tdu/fine/FineOutput.hh"

#include <stdio.h>
#include <memory>

using namespace Tdu::Core;

Unit::Unit(const Params&       para,
           Fine::PhaseShifter* fineOffset,
           Fine::PhaseShifter* fineWidth) :
  _config    (para.powerOn),
  _sync      (_config.edge, para.syncStages),
  _arbiter   (_config),
  _generator (_config),
  _fineOffset(fineOffset ? std::make_unique<Fine::FineChannel>(*fineOffset, para.syncStages)
                          : std::unique_ptr<Fine::FineChannel>()),
  _fineWidth (fineWidth  ? std::make_unique<Fine::FineChannel>(*fineWidth , para.syncStages)
                          : std::unique_ptr<Fine::FineChannel>()),
  _fineOutput((fineOffset || fineWidth) ? std::make_unique<Fine::FineOutput>(para.syncStages)
                                        : std::unique_ptr<Fine::FineOutput>()),
  _cmd       (_config, _arbiter, _generator,
              _fineOffset.get(), _fineWidth.get(),
              para.payloadTimeout, para.fineTimeout),
  _monitor   (0),
  _ticks     (0)
{
}

Unit::~Unit()
{
}

void Unit::tick(bool input, const uint8_t* rx, bool txReady)
{
  //  previous tick's outputs
  bool edge  = _sync.edge();
  bool soft  = _cmd.softTrigger();
  bool trig  = _arbiter.trigger();
  bool set   = _generator.rise();
  bool reset = _generator.fall();

  _sync     .tick(input);
  _arbiter  .tick(edge, soft);
  _generator.tick(trig);

  if (_fineOutput)
    _fineOutput->tick(set, reset);
  if (_fineOffset)
    _fineOffset->tick();
  if (_fineWidth)
    _fineWidth->tick();

  if (soft)
    _monitor = _config.softTriggerWidth ? _config.softTriggerWidth : 1;
  else if (_monitor)
    _monitor--;

  //  register writes land at the tick boundary
  _cmd.tick(rx, txReady);

  _ticks++;
}

bool Unit::output() const
{
  return _fineOutput ? _fineOutput->level() : _generator.output();
}

void Unit::dump() const
{
  printf("Unit tick %llu  output %u  monitor %u\n",
         (unsigned long long)_ticks, output() ? 1:0, monitor() ? 1:0);
  _config   .dump();
  _sync     .dump();
  _arbiter  .dump();
  _generator.dump();
  _cmd      .dump();
}
