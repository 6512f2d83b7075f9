#include "spockscan/discovery/model.hpp"

#include <string>
#include <string_view>

#include <fmt/core.h>

namespace spockscan::discovery {

auto MakeTestId(std::string_view file_id, std::string_view class_name)
    -> std::string {
  return fmt::format("{}#{}", file_id, class_name);
}

auto MakeTestId(
    std::string_view file_id, std::string_view class_name,
    std::string_view method_name) -> std::string {
  return fmt::format("{}#{}#{}", file_id, class_name, method_name);
}

}  // namespace spockscan::discovery
