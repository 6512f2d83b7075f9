#include "spockscan/discovery/grammar.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

#include "spockscan/common/string_utils.hpp"

namespace spockscan::discovery {

auto ParseBlockLabel(std::string_view trimmed) -> std::optional<BlockLabel> {
  auto colon = trimmed.find(':');
  if (colon == std::string_view::npos ||
      !common::Trim(trimmed.substr(colon + 1)).empty()) {
    return std::nullopt;
  }
  auto label = common::Trim(trimmed.substr(0, colon));
  for (std::size_t i = 0; i < kBlockLabelNames.size(); ++i) {
    if (kBlockLabelNames[i] == label) {
      return static_cast<BlockLabel>(i);
    }
  }
  return std::nullopt;
}

}  // namespace spockscan::discovery
