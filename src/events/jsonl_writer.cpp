#include "events/jsonl_writer.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace mcpcat::events {

bool AppendEventJsonl(const Event& event, const fs::path& path, std::string& error) {
  if (path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const fs::path parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      error = "failed to create output directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  std::ofstream out_file(path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + path.string() + "' for append";
    return false;
  }

  if (!WriteEventJsonl(event, out_file, error)) {
    error = "failed while writing event log '" + path.string() + "'";
    return false;
  }
  return true;
}

bool WriteEventJsonl(const Event& event, std::ostream& out, std::string& error) {
  out << ToJson(event) << '\n';
  if (!out) {
    error = "failed while writing event line";
    return false;
  }
  return true;
}

} // namespace mcpcat::events
