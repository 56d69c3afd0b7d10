#include "engine/result_writer.hpp"

#include <algorithm>

#include "util/file.hpp"

namespace engine {

std::string FormatResult(const Verdict& verdict) {
  std::string exit_msg = verdict.exit_msg;
  std::replace(exit_msg.begin(), exit_msg.end(), '\n', ' ');
  std::replace(exit_msg.begin(), exit_msg.end(), '\r', ' ');
  return StatusString(verdict) + "\n" + exit_msg + "\n" +
         std::to_string(verdict.duration_millis) + "\n" +
         std::to_string(verdict.memory_kb) + "\n";
}

void WriteResult(const std::string& path, const Verdict& verdict) {
  std::string content = FormatResult(verdict);
  auto receiver = util::File::Write(path, /*overwrite=*/true);
  receiver(kj::arrayPtr(reinterpret_cast<const kj::byte*>(content.data()),
                        content.size()));
  receiver(util::File::Chunk());
}

}  // namespace engine
