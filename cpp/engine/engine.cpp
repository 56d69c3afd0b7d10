#include "engine/engine.hpp"

#include <kj/debug.h>

#include "engine/language.hpp"
#include "engine/result_writer.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace engine {

namespace {
const constexpr int64_t kDefaultStackKb = 8 * 1024;
const constexpr int32_t kRunMaxFiles = 64;
const constexpr int32_t kCompileMaxFiles = 256;
const constexpr int64_t kMaxMlockKb = 64;
}  // namespace

bool Engine::BuildOptions(sandbox::ExecutionOptions* options,
                          std::string* error_msg) const {
  Command command = CommandFor(request_.language, request_.phase);
  if (command.executable.empty()) {
    *error_msg = std::string("no compiler found for ") +
                 LanguageName(request_.language);
    return false;
  }
  options->root = root_;
  options->executable = command.executable;
  options->SetArgs(command.args);
  options->prepare_executable = request_.phase == sandbox::Phase::kRun;

  options->stdin_file = request_.stdin_path;
  options->stdout_file = request_.stdout_path;
  options->stderr_file = request_.stderr_path;

  options->cpu_limit_millis = request_.time_limit_millis;
  options->wall_limit_millis = request_.time_limit_millis;
  options->memory_limit_kb = 2 * request_.memory_limit_kb;
  options->resident_limit_kb = request_.memory_limit_kb;
  options->max_stack_kb =
      request_.large_stack ? request_.memory_limit_kb : kDefaultStackKb;
  options->max_file_size_bytes = request_.output_limit_bytes;
  options->max_procs = static_cast<int32_t>(request_.process_limit);
  options->max_threads = static_cast<int32_t>(request_.process_limit);
  options->max_files = request_.phase == sandbox::Phase::kRun
                           ? kRunMaxFiles
                           : kCompileMaxFiles;
  options->max_mlock_kb = kMaxMlockKb;

  options->uid = Flags::uid;
  options->gid = Flags::gid;
  options->restrict_syscalls = true;
  options->phase = request_.phase;
  return true;
}

Verdict Engine::Execute() {
  sandbox::ExecutionOptions options(root_, "");
  sandbox::ExecutionInfo info;
  std::string error_msg;
  bool started = BuildOptions(&options, &error_msg);
  if (started) {
    KJ_LOG(INFO, "Executing", options.executable.c_str(),
           options.args.size());
    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    started = sb->Execute(options, &info, &error_msg);
  }
  return ResolveVerdict(request_, started, error_msg, info);
}

Verdict Engine::Run() {
  bool compile = request_.phase == sandbox::Phase::kCompile;
  std::string artifact = util::File::JoinPath(root_, kArtifact);
  // A stale artifact must not survive a failed compilation.
  if (compile && util::File::Exists(artifact)) util::File::Remove(artifact);

  Verdict verdict = Execute();

  bool compiled =
      verdict.status == Status::kExited && verdict.exit_code == 0;
  if (compile && !compiled && !Flags::keep_artifact &&
      util::File::Exists(artifact)) {
    util::File::Remove(artifact);
  }
  KJ_LOG(INFO, LanguageName(request_.language),
         sandbox::PhaseName(request_.phase), StatusString(verdict).c_str(),
         verdict.exit_msg.c_str(), verdict.duration_millis, verdict.memory_kb);
  WriteResult(request_.result_path, verdict);
  return verdict;
}

}  // namespace engine
