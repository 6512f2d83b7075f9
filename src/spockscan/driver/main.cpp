#include <argparse/argparse.hpp>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "commands.hpp"
#include "print.hpp"
#include "spockscan/common/diagnostic.hpp"

namespace {

namespace fs = std::filesystem;

// Split attached flag forms: -Cdir -> -C dir. Leaves -vv alone so argparse
// can count it.
auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char* raw_arg : argv) {
    std::string_view arg = raw_arg;
    if (arg.size() > 2 && arg.starts_with("-C")) {
      result.emplace_back(arg.substr(0, 2));
      result.emplace_back(arg.substr(2));
    } else {
      result.emplace_back(arg);
    }
  }
  return result;
}

auto ParsePort(const std::string& value) -> int {
  int port = 0;
  const char* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, port);
  if (ec != std::errc{} || ptr != end || port < 1 || port > UINT16_MAX) {
    throw spockscan::DiagnosticException(
        spockscan::Diagnostic::Error(
            fmt::format("invalid debug port {}", value))
            .WithNote("expected a number from 1 to 65535"));
  }
  return port;
}

void AddSelectionFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--class").required().help("Specification class name");
  cmd.add_argument("--test").required().help("Feature method name");
  cmd.add_argument("--workspace").help(
      "Project directory (default: config root or current directory)");
  cmd.add_argument("--tool").help(
      "Build tool: gradle or maven (default: detected)");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  auto args =
      PreprocessArgs(std::span<char*>(argv, static_cast<std::size_t>(argc)));

  spockscan::driver::GlobalOptions globals;

  argparse::ArgumentParser program("spockscan", "0.1.0");
  program.add_description(
      "Discover Spock specifications and read their iteration results");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--config").help("Path to spockscan.toml");
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++globals.verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log output (repeatable)");

  // Subcommand: discover
  argparse::ArgumentParser discover_cmd("discover");
  discover_cmd.add_description(
      "List specification classes, feature methods and data iterations");
  discover_cmd.add_argument("--ids")
      .default_value(false)
      .implicit_value(true)
      .help("Print test ids instead of the tree");
  discover_cmd.add_argument("--workspace").help(
      "Directory scanned when no paths are given");
  discover_cmd.add_argument("paths").remaining().help(
      "Groovy files or directories (default: workspace)");

  // Subcommand: results
  argparse::ArgumentParser results_cmd("results");
  results_cmd.add_description(
      "Report per-iteration results from a JUnit XML report or console log");
  AddSelectionFlags(results_cmd);
  results_cmd.add_argument("--console").help(
      "Captured build output ('-' for stdin)");
  results_cmd.add_argument("--report").help(
      "Report file (overrides the workspace layout)");

  // Subcommand: command
  argparse::ArgumentParser command_cmd("command");
  command_cmd.add_description(
      "Print the build tool command that runs one feature method");
  AddSelectionFlags(command_cmd);
  command_cmd.add_argument("--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Suspend the test JVM for a debugger");
  command_cmd.add_argument("--port")
      .action([](const std::string& value) { return ParsePort(value); })
      .help("JDWP port for Maven Surefire");
  command_cmd.add_argument("--no-timestamp")
      .default_value(false)
      .implicit_value(true)
      .help("Omit the run timestamp property");

  program.add_subparser(discover_cmd);
  program.add_subparser(results_cmd);
  program.add_subparser(command_cmd);

  try {
    program.parse_args(args);
  } catch (const spockscan::DiagnosticException& e) {
    spockscan::driver::PrintDiagnostic(e.GetDiagnostic());
    return 1;
  } catch (const std::exception& err) {
    spockscan::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (auto config = program.present("--config")) {
    globals.config_path = fs::absolute(*config);
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      spockscan::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("discover")) {
    return spockscan::driver::DiscoverCommand(discover_cmd, globals);
  }
  if (program.is_subcommand_used("results")) {
    return spockscan::driver::ResultsCommand(results_cmd, globals);
  }
  if (program.is_subcommand_used("command")) {
    return spockscan::driver::ComposeCommand(command_cmd, globals);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
