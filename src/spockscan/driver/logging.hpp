#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

namespace spockscan::driver {

// stderr color logger named "spockscan". Stdout stays free for results.
//
// The level comes from the configured name (warn when absent); each -v
// lowers it one step (info, then debug) but never raises it.
auto MakeLogger(int verbosity, std::string_view configured_level)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace spockscan::driver
