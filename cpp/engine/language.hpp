#ifndef ENGINE_LANGUAGE_HPP
#define ENGINE_LANGUAGE_HPP

#include <string>
#include <vector>
#include "engine/request.hpp"

namespace engine {

// Name of the compiled program, relative to the working directory. Compile
// writes it, Run executes it.
extern const char* const kArtifact;

// An executable with its arguments. An empty executable means the program
// could not be found.
struct Command {
  std::string executable;
  std::vector<std::string> args;
};

const char* LanguageName(Language language);

// Name of the source file Compile reads, relative to the working directory.
const char* SourceFile(Language language);

// Command that compiles SourceFile(language) into kArtifact. The compiler is
// looked up in PATH.
Command CompileCommand(Language language);

// Command that runs kArtifact. The path is relative to the working directory.
Command RunCommand(Language language);

Command CommandFor(Language language, sandbox::Phase phase);

}  // namespace engine

#endif
