#include "tdu/core/Registers.hh"

#include <stdio.h>

using namespace Tdu::Core;

const char* Tdu::Core::name(EdgeType e)
{
  static const char* names[] = {"none","rising","falling","both"};
  return names[unsigned(e)&3];
}

const char* Tdu::Core::name(TriggerMode m)
{
  return m==Internal ? "internal" : "external";
}

const char* Tdu::Core::name(ArmedMode m)
{
  return m==Repeat ? "repeat" : "single";
}

void Config::dump() const
{
  printf("coarseDelay      : %u\n", coarseDelay);
  printf("outputWidth      : %u\n", outputWidth);
  printf("edge             : %s\n", name(edge));
  printf("triggerMode      : %s\n", name(triggerMode));
  printf("armedMode        : %s\n", name(armedMode));
  printf("counterMode      : %u\n", counterMode ? 1:0);
  printf("edgeCountTarget  : %u\n", edgeCountTarget);
  printf("softTriggerWidth : %u\n", softTriggerWidth);
}
