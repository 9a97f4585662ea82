#include "tdu/fine/FineChannel.hh"

using namespace Tdu::Fine;

const Tdu::Core::EdgeType FineChannel::_rising = Tdu::Core::EdgeRising;

FineChannel::FineChannel(PhaseShifter& shifter, unsigned stages) :
  _shifter (shifter),
  _target  (0),
  _value   (shifter.current()),
  _pending (false),
  _req     (false),
  _issued  (false),
  _sawBusy (false),
  _done    (false),
  _reqSync (_rising, stages),
  _ackSync (_rising, stages),
  _lockSync(_rising, stages)
{
}

void FineChannel::request(int32_t target)
{
  //  target must stay stable while the request is raised; a request
  //  already on the line is dropped so the new one gets its own edge
  _target  = target;
  _pending = true;
  _req     = false;
  _issued  = false;
  _sawBusy = false;
}

void FineChannel::abort(int32_t restore)
{
  request(restore);
}

void FineChannel::tick()
{
  if (_pending && !_reqSync.level()) {
    _pending = false;
    _req     = true;
  }

  //  shifter domain; a request accepted here is seen busy by this tick's sample
  _shifter.tick();
  _reqSync.tick(_req);
  if (_reqSync.edge()) {
    _shifter.configure(_target);
    _issued = true;
  }

  //  tick domain
  _ackSync .tick(_shifter.configured());
  _lockSync.tick(_shifter.locked());

  _done = false;
  if (_req && _issued) {
    if (!_ackSync.level())
      _sawBusy = true;
    else if (_sawBusy && _ackSync.rise()) {
      _req   = false;
      _done  = true;
      _value = _shifter.current();
    }
  }
}
