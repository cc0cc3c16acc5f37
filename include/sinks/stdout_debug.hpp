#pragma once

#include "model/risk_snapshot.hpp"

namespace crowd_ews::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::risk_snapshot& snapshot) const;
};

}  // namespace crowd_ews::sinks
