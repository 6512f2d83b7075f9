#pragma once

#include <string>
#include <vector>

#include "tests/framework/discovery_case.hpp"

namespace spockscan::test {

auto LoadDiscoveryCasesFromYaml(const std::string& path)
    -> std::vector<DiscoveryCase>;

}  // namespace spockscan::test
