#include "commands.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/logger.h>

#include "input.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "spockscan/build/build_tool.hpp"
#include "spockscan/common/diagnostic.hpp"
#include "spockscan/common/spdlog_event_sink.hpp"
#include "spockscan/config/project_config.hpp"
#include "spockscan/discovery/model.hpp"
#include "spockscan/discovery/source_parser.hpp"
#include "spockscan/results/failure_extractor.hpp"
#include "spockscan/results/iteration_result.hpp"
#include "spockscan/results/reconciler.hpp"

namespace spockscan::driver {

namespace {

namespace fs = std::filesystem;

// Everything a subcommand needs after global options are applied.
struct Session {
  std::optional<config::ProjectConfig> config;
  std::shared_ptr<spdlog::logger> logger;
};

auto OpenSession(const GlobalOptions& globals) -> Result<Session> {
  auto config = LoadOptionalConfig(globals.config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  std::string level = *config ? (*config)->log_level : std::string("warn");
  auto logger = MakeLogger(globals.verbosity, level);
  if (*config) {
    logger->debug("using workspace {}", (*config)->root_dir.string());
  }
  return Session{.config = std::move(*config), .logger = std::move(logger)};
}

auto ResolveWorkspace(
    const argparse::ArgumentParser& cmd, const Session& session) -> fs::path {
  if (auto dir = cmd.present<std::string>("--workspace")) {
    return fs::path(*dir);
  }
  if (session.config) {
    return session.config->root_dir;
  }
  return fs::current_path();
}

auto ResolveBuildTool(
    const argparse::ArgumentParser& cmd, const Session& session,
    const fs::path& workspace) -> Result<std::optional<build::BuildTool>> {
  if (auto name = cmd.present<std::string>("--tool")) {
    auto tool = build::ParseBuildTool(*name);
    if (!tool) {
      return std::unexpected(std::move(tool.error()));
    }
    return std::optional<build::BuildTool>{*tool};
  }
  if (session.config && session.config->build_tool) {
    return session.config->build_tool;
  }
  return build::DetectBuildTool(workspace);
}

auto Plural(std::size_t count, std::string_view noun) -> std::string {
  if (count == 1) {
    return fmt::format("{} {}", count, noun);
  }
  if (noun.ends_with("s")) {
    return fmt::format("{} {}es", count, noun);
  }
  return fmt::format("{} {}s", count, noun);
}

void PrintClassTree(const discovery::TestClass& test_class) {
  fmt::print(
      "  {} (line {}){}\n", test_class.name, test_class.declaration_line + 1,
      test_class.IsRunnable() ? "" : " (abstract, not runnable)");
  for (const auto& method : test_class.methods) {
    if (method.is_data_driven) {
      fmt::print(
          "    {} (line {}, {})\n", method.name, method.declaration_line + 1,
          Plural(method.data_iterations.size(), "iteration"));
    } else {
      fmt::print(
          "    {} (line {})\n", method.name, method.declaration_line + 1);
    }
    for (const auto& iteration : method.data_iterations) {
      fmt::print(
          "      [{}] {} (line {})\n", iteration.index, iteration.display_name,
          iteration.range.start_line + 1);
    }
  }
}

// Quote an argument for a POSIX shell when it needs it.
auto QuoteArgument(std::string_view arg) -> std::string {
  constexpr std::string_view kSafe =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
      "_-./#:=,+@%";
  if (!arg.empty() && arg.find_first_not_of(kSafe) == std::string_view::npos) {
    return std::string(arg);
  }
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

auto StatusStyle(results::IterationStatus status) -> fmt::text_style {
  switch (status) {
    case results::IterationStatus::kPassed:
      return fmt::fg(fmt::terminal_color::green);
    case results::IterationStatus::kFailed:
      return fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
    case results::IterationStatus::kSkipped:
      return fmt::fg(fmt::terminal_color::yellow);
  }
  return {};
}

void PrintIterationResult(const results::TestIterationResult& result) {
  fmt::print(
      "{:<7} #{} {} ({:.3f}s)\n",
      fmt::styled(results::ToString(result.status), StatusStyle(result.status)),
      result.index, result.display_name, result.duration);
  if (!result.error_info || result.error_info->empty()) {
    return;
  }
  // Console results carry a one-line summary; report bodies carry the whole
  // assertion dump and stack trace.
  if (result.error_info->find('\n') == std::string::npos) {
    fmt::print("        {}\n", *result.error_info);
    return;
  }
  auto failure = results::ExtractFailure(*result.error_info);
  fmt::print("        {}\n", failure.message);
  if (failure.location) {
    fmt::print(
        "        at {}:{}\n", failure.location->file.string(),
        failure.location->line + 1);
  }
}

}  // namespace

auto DiscoverCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& globals) -> int {
  auto session = OpenSession(globals);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  std::vector<std::string> paths;
  if (auto given = cmd.present<std::vector<std::string>>("paths")) {
    paths = *given;
  }
  if (paths.empty()) {
    paths.push_back(ResolveWorkspace(cmd, *session).string());
  }
  std::vector<std::string> exclude =
      session->config ? session->config->exclude
                      : std::vector<std::string>{"bin"};

  auto files = CollectSourceFiles(paths, exclude);
  if (!files) {
    PrintDiagnostic(files.error());
    return 1;
  }
  session->logger->info("scanning {}", Plural(files->size(), "file"));

  DiagnosticSink diagnostics;
  if (files->empty()) {
    diagnostics.Warning("no Groovy sources found");
  }

  bool print_ids = cmd.get<bool>("--ids");
  SpdlogEventSink events(session->logger);
  std::size_t class_count = 0;
  std::size_t method_count = 0;
  std::size_t iteration_count = 0;

  for (const auto& file : *files) {
    auto content = ReadTextFile(file);
    if (!content) {
      diagnostics.Report(std::move(content.error()));
      continue;
    }
    auto classes = discovery::ParseSpecSource(*content, events);
    if (classes.empty()) {
      continue;
    }

    auto file_id = file.generic_string();
    if (!print_ids) {
      fmt::print("{}\n", file_id);
    }
    for (const auto& test_class : classes) {
      ++class_count;
      method_count += test_class.methods.size();
      for (const auto& method : test_class.methods) {
        iteration_count += method.data_iterations.size();
      }

      if (!print_ids) {
        PrintClassTree(test_class);
        continue;
      }
      fmt::print("{}\n", discovery::MakeTestId(file_id, test_class.name));
      for (const auto& method : test_class.methods) {
        fmt::print(
            "{}\n",
            discovery::MakeTestId(file_id, test_class.name, method.name));
      }
    }
  }

  if (!print_ids) {
    fmt::print(
        "{}, {}, {}\n", Plural(class_count, "class"),
        Plural(method_count, "method"), Plural(iteration_count, "iteration"));
  }
  PrintDiagnostics(diagnostics);
  return diagnostics.HasErrors() ? 1 : 0;
}

auto ResultsCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& globals) -> int {
  auto session = OpenSession(globals);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  auto class_name = cmd.get<std::string>("--class");
  auto test_name = cmd.get<std::string>("--test");

  std::string console_text;
  if (auto console_path = cmd.present<std::string>("--console")) {
    auto content = ReadTextFile(*console_path);
    if (!content) {
      PrintDiagnostic(content.error());
      return 1;
    }
    console_text = std::move(*content);
  }

  SpdlogEventSink events(session->logger);
  std::vector<results::TestIterationResult> iterations;
  if (auto report = cmd.present<std::string>("--report")) {
    std::error_code ec;
    if (!fs::exists(*report, ec)) {
      PrintWarning(fmt::format("report file '{}' not found", *report));
    }
    iterations =
        results::ReconcileResults(*report, console_text, test_name, events);
  } else if (session->config && session->config->reports_dir &&
             !cmd.present<std::string>("--workspace")) {
    iterations = results::ReconcileResults(
        *session->config->reports_dir / fmt::format("TEST-{}.xml", class_name),
        console_text, test_name, events);
  } else {
    auto workspace = ResolveWorkspace(cmd, *session);
    auto tool = ResolveBuildTool(cmd, *session, workspace);
    if (!tool) {
      PrintDiagnostic(tool.error());
      return 1;
    }
    auto layout = *tool == build::BuildTool::kMaven
                      ? results::ReportLayout::kMavenSurefire
                      : results::ReportLayout::kGradle;
    iterations = results::ParseTestResults(
        console_text, test_name, class_name, workspace, layout, events);
  }

  if (iterations.empty()) {
    PrintError(
        fmt::format("no iteration results for '{}.{}'", class_name, test_name));
    return 2;
  }

  std::size_t passed = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  for (const auto& result : iterations) {
    PrintIterationResult(result);
    switch (result.status) {
      case results::IterationStatus::kPassed:
        ++passed;
        break;
      case results::IterationStatus::kFailed:
        ++failed;
        break;
      case results::IterationStatus::kSkipped:
        ++skipped;
        break;
    }
  }
  fmt::print("{} passed, {} failed, {} skipped\n", passed, failed, skipped);
  return passed == iterations.size() ? 0 : 1;
}

auto ComposeCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& globals) -> int {
  auto session = OpenSession(globals);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  auto workspace = ResolveWorkspace(cmd, *session);
  auto tool = ResolveBuildTool(cmd, *session, workspace);
  if (!tool) {
    PrintDiagnostic(tool.error());
    return 1;
  }
  if (!*tool) {
    PrintDiagnostic(
        Diagnostic::Error(
            DiagLocation{.file = workspace, .line = std::nullopt},
            "cannot detect build tool")
            .WithNote("expected build.gradle, build.gradle.kts or pom.xml; "
                      "or pass --tool"));
    return 1;
  }

  build::CommandOptions options;
  options.debug = cmd.get<bool>("--debug");
  options.workspace = workspace;
  // Range checked while parsing arguments.
  if (auto port = cmd.present<int>("--port")) {
    options.debug_port = static_cast<uint16_t>(*port);
  }
  if (!cmd.get<bool>("--no-timestamp")) {
    options.timestamp =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count();
  }

  auto class_name = cmd.get<std::string>("--class");
  auto test_name = cmd.get<std::string>("--test");
  session->logger->info(
      "{} project '{}'", build::ToString(**tool),
      build::GetProjectName(workspace));

  auto args = build::BuildTestCommand(**tool, class_name, test_name, options);
  std::string line;
  for (const auto& arg : args) {
    if (!line.empty()) {
      line += ' ';
    }
    line += QuoteArgument(arg);
  }
  fmt::print("{}\n", line);
  return 0;
}

}  // namespace spockscan::driver
