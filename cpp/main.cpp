#include "engine/main.hpp"

class ExecboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit ExecboxMain(kj::ProcessContext& context)
      : context(context), em(&context) {}
  kj::MainFunc getMain() { return em.getMain(); }

 private:
  kj::ProcessContext& context;
  engine::Main em;
};

KJ_MAIN(ExecboxMain);
