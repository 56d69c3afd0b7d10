#include "engine/language.hpp"

#include <kj/debug.h>

#include "util/which.hpp"

namespace engine {

const char* const kArtifact = "main";

const char* LanguageName(Language language) {
  switch (language) {
    case Language::kC:
      return "C";
    case Language::kCpp:
      return "C++";
  }
  KJ_UNREACHABLE;
}

const char* SourceFile(Language language) {
  switch (language) {
    case Language::kC:
      return "main.c";
    case Language::kCpp:
      return "main.cpp";
  }
  KJ_UNREACHABLE;
}

Command CompileCommand(Language language) {
  Command command;
  switch (language) {
    case Language::kC:
      command.executable = util::which("gcc");
      command.args = {"-std=gnu11", "-O2", "-Wall", "-o", kArtifact,
                      SourceFile(language), "-lm", "-lpthread"};
      break;
    case Language::kCpp:
      command.executable = util::which("g++");
      command.args = {"-std=gnu++17", "-O2", "-Wall", "-o", kArtifact,
                      SourceFile(language), "-lpthread"};
      break;
  }
  return command;
}

Command RunCommand(Language /*language*/) {
  // Every supported language is compiled to a native executable.
  return Command{std::string("./") + kArtifact, {}};
}

Command CommandFor(Language language, sandbox::Phase phase) {
  switch (phase) {
    case sandbox::Phase::kCompile:
      return CompileCommand(language);
    case sandbox::Phase::kRun:
      return RunCommand(language);
  }
  KJ_UNREACHABLE;
}

}  // namespace engine
