#include "spockscan/common/event_sink.hpp"

#include <spdlog/spdlog.h>

#include "spockscan/common/spdlog_event_sink.hpp"

namespace spockscan {

namespace {

class DiscardingEventSink final : public EventSink {
 public:
  void Record(const ParseEvent& /*event*/) override {
  }
};

}  // namespace

auto NullEventSink() -> EventSink& {
  static DiscardingEventSink sink;
  return sink;
}

void SpdlogEventSink::Record(const ParseEvent& event) {
  if (!logger_) {
    return;
  }
  switch (event.level) {
    case EventLevel::kDebug:
      logger_->debug("[{}] {}", event.component, event.message);
      break;
    case EventLevel::kInfo:
      logger_->info("[{}] {}", event.component, event.message);
      break;
    case EventLevel::kWarning:
      logger_->warn("[{}] {}", event.component, event.message);
      break;
  }
}

}  // namespace spockscan
