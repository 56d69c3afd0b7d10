#include "engine/main.hpp"
#include <system_error>

#include "engine/engine.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace engine {

kj::Function<kj::MainBuilder::Validity(kj::StringPtr)> Main::Arg(
    std::function<bool(const std::string&, std::string*)> parse) {
  return [parse](kj::StringPtr arg) -> kj::MainBuilder::Validity {
    std::string error_msg;
    if (!parse(arg.cStr(), &error_msg)) return kj::str(error_msg.c_str());
    return true;
  };
}

kj::MainBuilder::Validity Main::Run() {
  std::string error_msg;
  if (!request_.Validate(&error_msg)) return kj::str(error_msg.c_str());
  util::LogManager log_manager(context);
  try {
    Engine engine(request_);
    engine.Run();
  } catch (std::system_error& ex) {
    KJ_LOG(ERROR, "Cannot complete the execution", ex.what());
    return kj::str(ex.what());
  }
  return true;
}

kj::MainFunc Main::getMain() {
  ExecutionRequest* r = &request_;
  return kj::MainBuilder(
             context, "execbox (" + util::version + ")",
             "Compiles or runs a C or C++ program in a sandbox and writes "
             "the verdict to <result>. Compilation reads main.c or main.cpp "
             "and produces ./main in the current directory.")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'u', "uid"}, util::setInt(Flags::uid), "<UID>",
                        "Run the program as this user")
      .addOptionWithArg({'g', "gid"}, util::setInt(Flags::gid), "<GID>",
                        "Run the program as this group")
      .addOption({"keep-artifact"}, util::setBool(Flags::keep_artifact),
                 "Do not remove ./main when the compilation fails")
      .expectArg("<language>", Arg([r](const std::string& a, std::string* e) {
                   return ParseLanguage(a, &r->language, e);
                 }))
      .expectArg("<compile>", Arg([r](const std::string& a, std::string* e) {
                   return ParsePhase(a, &r->phase, e);
                 }))
      .expectArg("<stdin>", Arg([r](const std::string& a, std::string* e) {
                   return ParsePath(a, "stdin path", &r->stdin_path, e);
                 }))
      .expectArg("<stdout>", Arg([r](const std::string& a, std::string* e) {
                   return ParsePath(a, "stdout path", &r->stdout_path, e);
                 }))
      .expectArg("<stderr>", Arg([r](const std::string& a, std::string* e) {
                   return ParsePath(a, "stderr path", &r->stderr_path, e);
                 }))
      .expectArg("<time_ms>", Arg([r](const std::string& a, std::string* e) {
                   return ParseLimit(a, "time limit", &r->time_limit_millis,
                                     e);
                 }))
      .expectArg("<memory_kb>", Arg([r](const std::string& a, std::string* e) {
                   return ParseLimit(a, "memory limit", &r->memory_limit_kb,
                                     e);
                 }))
      .expectArg("<large_stack>",
                 Arg([r](const std::string& a, std::string* e) {
                   return ParseSwitch(a, "large stack flag", &r->large_stack,
                                      e);
                 }))
      .expectArg("<output_bytes>",
                 Arg([r](const std::string& a, std::string* e) {
                   return ParseLimit(a, "output limit",
                                     &r->output_limit_bytes, e);
                 }))
      .expectArg("<processes>", Arg([r](const std::string& a, std::string* e) {
                   return ParseLimit(a, "process limit", &r->process_limit,
                                     e);
                 }))
      .expectArg("<result>", Arg([r](const std::string& a, std::string* e) {
                   return ParsePath(a, "result path", &r->result_path, e);
                 }))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace engine
