#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/common/value.hpp"
#include "spockscan/results/iteration_result.hpp"

namespace spockscan::results {

// Parameters and index of an unrolled iteration name.
struct IterationInfo {
  uint32_t index = 0;
  ValueList parameters;

  auto operator==(const IterationInfo&) const -> bool = default;
};

// Read a `<base> [k1: v1, k2: v2, #N]` name. nullopt when the name carries
// no iteration suffix.
auto ExtractIterationInfo(std::string_view name)
    -> std::optional<IterationInfo>;

// "k1: v1, k2: v2" -> ordered parameters. Values use the result-line
// coercion (CoerceResultToken). Pieces without a colon are dropped.
auto ParseParameterList(std::string_view text) -> ValueList;

// Scan build tool console output for
//   `... > <method_name> [<params>, #<N>] PASSED|FAILED|SKIPPED`
// lines and turn each into a result, in the order they appear.
auto ParseConsoleOutput(
    std::string_view text, std::string_view method_name,
    EventSink& sink = NullEventSink()) -> std::vector<TestIterationResult>;

}  // namespace spockscan::results
