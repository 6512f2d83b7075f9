#pragma once

#include <filesystem>
#include <optional>

#include <argparse/argparse.hpp>

namespace spockscan::driver {

// Options given before the subcommand.
struct GlobalOptions {
  int verbosity = 0;
  std::optional<std::filesystem::path> config_path;
};

auto DiscoverCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& globals) -> int;
auto ResultsCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& globals) -> int;
auto ComposeCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& globals) -> int;

}  // namespace spockscan::driver
