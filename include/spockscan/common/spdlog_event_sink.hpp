#pragma once

#include <memory>
#include <utility>

#include <spdlog/logger.h>

#include "spockscan/common/event_sink.hpp"

namespace spockscan {

// Forwards parse events to an spdlog logger as "[component] message".
class SpdlogEventSink final : public EventSink {
 public:
  explicit SpdlogEventSink(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {
  }

  void Record(const ParseEvent& event) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spockscan
