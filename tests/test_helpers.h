#pragma once

#include "loadsim/config.h"

namespace loadsim::testutil {

// A machine that neither speeds up nor slows down the base processing time.
inline HardwareConfig NeutralHardware(int cores = 1) {
  HardwareConfig h;
  h.name = "neutral";
  h.processing_power = 1.0;
  h.io_latency_ms = 0.0;
  h.num_cores = cores;
  return h;
}

inline LanguageProfile NeutralLanguage() {
  LanguageProfile l;
  l.name = "neutral";
  l.efficiency_factor = 1.0;
  return l;
}

// Deterministic single-server scenario: constant traffic, fixed service time, no degradation.
inline ScenarioParameters NeutralScenario(double rate, double processing_ms, double duration) {
  ScenarioParameters p;
  p.name = "neutral";
  p.duration = duration;
  p.hardware = NeutralHardware();
  p.language = NeutralLanguage();
  p.traffic.pattern = TrafficPattern::Constant;
  p.traffic.base_rate = rate;
  p.processing_time_ms = processing_ms;
  p.cpu_degradation_enabled = false;
  return p;
}

}  // namespace loadsim::testutil
