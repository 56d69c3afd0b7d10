#ifndef ENGINE_MAIN_HPP
#define ENGINE_MAIN_HPP
#include <functional>
#include <string>

#include <kj/main.h>
#include "engine/request.hpp"

namespace engine {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  // Wraps a parser of a positional argument into a kj argument callback.
  static kj::Function<kj::MainBuilder::Validity(kj::StringPtr)> Arg(
      std::function<bool(const std::string&, std::string*)> parse);

  kj::ProcessContext& context;
  ExecutionRequest request_;
};
}  // namespace engine
#endif
