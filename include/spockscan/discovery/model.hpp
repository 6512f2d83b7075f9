#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spockscan/common/source_range.hpp"
#include "spockscan/common/value.hpp"

namespace spockscan::discovery {

// One concrete parameter set of a data-driven feature method.
struct DataIteration {
  // Discovery order, not necessarily the order the build tool reports.
  uint32_t index = 0;
  ValueList data_values;
  std::string display_name;
  SourceRange range;
  std::string original_method_name;

  auto operator==(const DataIteration&) const -> bool = default;
};

struct TestMethod {
  // Quoted description without quotes, or the bare identifier.
  std::string name;
  uint32_t declaration_line = 0;
  SourceRange range;
  bool is_data_driven = false;
  // Empty unless is_data_driven.
  std::vector<DataIteration> data_iterations;
  std::optional<SourceRange> where_block_range;

  auto operator==(const TestMethod&) const -> bool = default;
};

struct TestClass {
  std::string name;
  uint32_t declaration_line = 0;
  SourceRange range;
  // Abstract specifications are kept but are not runnable on their own.
  bool is_abstract = false;
  std::vector<TestMethod> methods;

  auto operator==(const TestClass&) const -> bool = default;

  [[nodiscard]] auto IsRunnable() const -> bool {
    return !is_abstract;
  }
};

// Stable id for a discovered item: "<file>#<Class>" or
// "<file>#<Class>#<method>".
auto MakeTestId(std::string_view file_id, std::string_view class_name)
    -> std::string;
auto MakeTestId(
    std::string_view file_id, std::string_view class_name,
    std::string_view method_name) -> std::string;

}  // namespace spockscan::discovery
