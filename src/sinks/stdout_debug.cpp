#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <string>

#include "core/timestamp.hpp"

namespace crowd_ews::sinks {

void StdoutDebugSink::publish(const model::risk_snapshot& snapshot) const {
  const std::string timestamp = core::format_iso8601_ms(snapshot.timestamp_ms);
  std::printf("[snapshot] seq=%llu ts=%s phase=%s cai=%.3f cdi=%.3f thi=%.3f ti=%.3f ei=%.3f bi=%.3f risk=%.3f "
              "extended=%.3f alert=%s%s\n",
              static_cast<unsigned long long>(snapshot.sequence), timestamp.c_str(),
              snapshot.phase.empty() ? "-" : snapshot.phase.c_str(), snapshot.indices.cai, snapshot.indices.cdi,
              snapshot.indices.thi, snapshot.indices.ti, snapshot.indices.ei, snapshot.behavioral_intention,
              snapshot.physical_risk, snapshot.extended_risk, model::to_string(snapshot.level),
              snapshot.degraded ? " degraded" : "");
}

}  // namespace crowd_ews::sinks
