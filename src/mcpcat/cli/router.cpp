#include "mcpcat/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"
#include "scrub/event_pipeline.hpp"
#include "scrub/limits.hpp"

#include <cctype>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace mcpcat::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";
constexpr std::string_view kStdinPath = "-";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInvalidInput = core::errors::ToInt(core::errors::ExitCode::kInvalidInput);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  mcpcat-scrub scrub <events.jsonl|-> [--out <file>] "
         "[--log-level <debug|info|warn|error>] [--fail-fast]\n"
      << "  mcpcat-scrub size <events.jsonl|->\n"
      << "  mcpcat-scrub version\n";
}

bool IsBlankLine(std::string_view line) {
  for (const char c : line) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

// Opens `path` for reading, or hands back stdin for "-".
class InputSource {
public:
  bool Open(const std::string& path, std::string& error) {
    if (path == kStdinPath) {
      in_ = &std::cin;
      return true;
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
      error = "input file not found: " + path;
      return false;
    }
    file_.open(path, std::ios::binary);
    if (!file_) {
      error = "unable to open input file: " + path;
      return false;
    }
    in_ = &file_;
    return true;
  }

  // Next non-blank line with any trailing CR removed. `line_number` is
  // 1-based and counts blank lines too.
  bool NextLine(std::string& line, std::size_t& line_number) {
    while (std::getline(*in_, line)) {
      ++line_number_;
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (IsBlankLine(line)) {
        continue;
      }
      line_number = line_number_;
      return true;
    }
    return false;
  }

  // True when reading stopped on an I/O error rather than end of input.
  bool Failed() const {
    return in_->bad();
  }

private:
  std::ifstream file_;
  std::istream* in_ = &std::cin;
  std::size_t line_number_ = 0;
};

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "mcpcat-scrub " << kVersion << '\n';
  return kExitSuccess;
}

// Parse `scrub` args with an explicit contract:
// - one input path (or "-")
// - optional `--out <file>`, `--log-level <level>`, `--fail-fast`
// Any unknown flags or duplicate positional args are treated as usage errors.
bool ParseScrubOptions(const std::vector<std::string_view>& args, ScrubOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    if (token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_path = fs::path(std::string(args[++i]));
      continue;
    }

    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[++i], options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (token == "--fail-fast") {
      options.fail_fast = true;
      continue;
    }

    if (token.size() > 1U && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    if (!options.input_path.empty()) {
      error = "scrub accepts exactly one input path";
      return false;
    }
    options.input_path = std::string(token);
  }

  if (options.input_path.empty()) {
    error = "scrub requires an input path: <events.jsonl|->";
    return false;
  }
  return true;
}

int ExecuteScrub(const ScrubOptions& options) {
  core::logging::Logger logger(options.log_level);

  std::string error;
  InputSource input;
  if (!input.Open(options.input_path, error)) {
    logger.Error("failed to open input", {{"path", options.input_path}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::ofstream out_file;
  std::ostream* out = &std::cout;
  if (!options.output_path.empty()) {
    const fs::path parent = options.output_path.parent_path();
    std::error_code ec;
    if (!parent.empty()) {
      fs::create_directories(parent, ec);
    }
    if (ec) {
      std::cerr << "error: failed to create output directory '" << parent.string()
                << "': " << ec.message() << '\n';
      return kExitFailure;
    }
    out_file.open(options.output_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      std::cerr << "error: unable to open output file: " << options.output_path.string() << '\n';
      return kExitFailure;
    }
    out = &out_file;
  }

  scrub::PipelineOptions pipeline;
  pipeline.logger = &logger;

  std::size_t written = 0;
  std::size_t skipped = 0;
  std::size_t over_budget = 0;
  std::string line;
  std::size_t line_number = 0;

  while (input.NextLine(line, line_number)) {
    const std::string line_label = std::to_string(line_number);

    events::Event event;
    if (!events::FromJson(line, event, error)) {
      logger.Warn("skipping invalid event line", {{"line", line_label}, {"error", error}});
      if (options.fail_fast) {
        std::cerr << "error: line " << line_label << ": " << error << '\n';
        return kExitFailure;
      }
      ++skipped;
      continue;
    }

    scrub::PreparedEvent prepared;
    if (!scrub::PrepareEvent(event, pipeline, prepared, error)) {
      if (options.fail_fast) {
        std::cerr << "error: line " << line_label << ": " << error << '\n';
        return kExitFailure;
      }
      ++skipped;
      continue;
    }
    if (!prepared.report.within_budget) {
      ++over_budget;
    }

    if (!events::WriteEventJsonl(prepared.event, *out, error)) {
      logger.Error("failed to write scrubbed event", {{"line", line_label}, {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    ++written;
  }

  if (input.Failed()) {
    logger.Error("failed while reading input", {{"path", options.input_path}});
    std::cerr << "error: failed while reading input: " << options.input_path << '\n';
    return kExitFailure;
  }

  out->flush();
  if (!*out) {
    std::cerr << "error: failed to flush scrubbed events\n";
    return kExitFailure;
  }

  logger.Info("scrub complete", {{"written", std::to_string(written)},
                                 {"skipped", std::to_string(skipped)},
                                 {"over_budget", std::to_string(over_budget)}});
  return skipped == 0U ? kExitSuccess : kExitInvalidInput;
}

int CommandScrub(const std::vector<std::string_view>& args) {
  ScrubOptions options;
  std::string error;
  if (!ParseScrubOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteScrub(options);
}

// Reports the canonical byte size of each event as read, before any scrubbing.
int CommandSize(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: size requires exactly 1 argument: <events.jsonl|->\n";
    return kExitUsage;
  }

  std::string error;
  InputSource input;
  if (!input.Open(std::string(args.front()), error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  bool any_over = false;
  bool any_invalid = false;
  std::string line;
  std::size_t line_number = 0;

  while (input.NextLine(line, line_number)) {
    events::Event event;
    if (!events::FromJson(line, event, error)) {
      std::cerr << "error: line " << line_number << ": " << error << '\n';
      any_invalid = true;
      continue;
    }

    const std::size_t bytes = events::ByteSize(event);
    std::cout << "line=" << line_number << " bytes=" << bytes << '\n';
    if (bytes > scrub::kMaxEventBytes) {
      any_over = true;
    }
  }

  if (input.Failed()) {
    std::cerr << "error: failed while reading input: " << args.front() << '\n';
    return kExitFailure;
  }
  if (any_over) {
    return kExitFailure;
  }
  return any_invalid ? kExitInvalidInput : kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "scrub") {
    return CommandScrub(args);
  }

  if (command == "size") {
    return CommandSize(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace mcpcat::cli
