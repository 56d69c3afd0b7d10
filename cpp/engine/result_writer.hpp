#ifndef ENGINE_RESULT_WRITER_HPP
#define ENGINE_RESULT_WRITER_HPP

#include <string>
#include "engine/verdict.hpp"

namespace engine {

// The content of the result file: status, exit message, duration and memory,
// one per line. Newlines in the exit message are replaced by spaces.
std::string FormatResult(const Verdict& verdict);

// Atomically replaces path with the formatted verdict. Throws
// std::system_error on failure.
void WriteResult(const std::string& path, const Verdict& verdict);

}  // namespace engine

#endif
