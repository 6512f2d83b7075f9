#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spockscan {

enum class EventLevel : uint8_t {
  kDebug,
  kInfo,
  kWarning,
};

// Operational event emitted by a parser. Events never influence parse
// results; they exist so a host can see what the heuristics decided.
struct ParseEvent {
  std::string_view component;
  EventLevel level;
  std::string message;
};

// Injected logging seam for the parsers.
class EventSink {
 public:
  EventSink() = default;
  EventSink(const EventSink&) = delete;
  EventSink(EventSink&&) = delete;
  auto operator=(const EventSink&) -> EventSink& = delete;
  auto operator=(EventSink&&) -> EventSink& = delete;
  virtual ~EventSink() = default;

  virtual void Record(const ParseEvent& event) = 0;
};

// Shared sink that drops everything. Default for every parser entry point.
auto NullEventSink() -> EventSink&;

// Keeps events in memory, in order of recording. Not thread-safe.
class CollectingEventSink final : public EventSink {
 public:
  struct Entry {
    std::string component;
    EventLevel level;
    std::string message;
  };

  void Record(const ParseEvent& event) override {
    entries_.push_back(
        Entry{
            .component = std::string(event.component),
            .level = event.level,
            .message = event.message,
        });
  }

  [[nodiscard]] auto Entries() const -> const std::vector<Entry>& {
    return entries_;
  }

 private:
  std::vector<Entry> entries_;
};

}  // namespace spockscan
