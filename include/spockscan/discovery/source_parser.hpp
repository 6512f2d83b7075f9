#pragma once

#include <string_view>
#include <vector>

#include "spockscan/common/event_sink.hpp"
#include "spockscan/discovery/model.hpp"

namespace spockscan::discovery {

// Recover the specification classes of one Groovy source file, with their
// feature methods and data iterations, in declaration order.
//
// Heuristic and line-based: no Groovy grammar is involved. Input that does
// not look like a specification gives an empty result; nothing throws for
// malformed text.
auto ParseSpecSource(
    std::string_view content, EventSink& sink = NullEventSink())
    -> std::vector<TestClass>;

}  // namespace spockscan::discovery
