#include "engine/engine.hpp"
#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "engine/language.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::SizeIs;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/execbox_testdir";

using namespace engine;  // NOLINT

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

std::vector<std::string> readLines(const std::string& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

// Compiles and runs programs in a fresh working directory.
class EngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmp_.reset(new util::TempDir(test_tmpdir));
    std::ofstream(Path("input.txt")) << "21\n";
  }

  const std::string& Dir() const { return tmp_->Path(); }

  std::string Path(const std::string& name) const {
    return util::File::JoinPath(tmp_->Path(), name);
  }

  ExecutionRequest Request(Language language, sandbox::Phase phase) const {
    ExecutionRequest request;
    request.language = language;
    request.phase = phase;
    request.stdin_path = Path("input.txt");
    request.stdout_path = Path("stdout.txt");
    request.stderr_path = Path("stderr.txt");
    request.result_path = Path("result.txt");
    // RLIMIT_NPROC counts every process of the user running the tests.
    request.process_limit = 4096;
    if (phase == sandbox::Phase::kCompile) {
      request.time_limit_millis = 20000;
      request.memory_limit_kb = 512 * 1024;
      request.output_limit_bytes = 1 << 20;
    } else {
      request.time_limit_millis = 1000;
      request.memory_limit_kb = 64 * 1024;
      request.output_limit_bytes = 1 << 16;
    }
    return request;
  }

  Verdict Compile(const std::string& source, Language language = Language::kC) {
    std::ofstream(Path(SourceFile(language))) << source;
    return Engine(Request(language, sandbox::Phase::kCompile), tmp_->Path())
        .Run();
  }

  Verdict Run(Language language = Language::kC) {
    return Engine(Request(language, sandbox::Phase::kRun), tmp_->Path()).Run();
  }

  // Compiles a program that is expected to build, and runs it.
  Verdict CompileAndRun(const std::string& source,
                        Language language = Language::kC) {
    Verdict compiled = Compile(source, language);
    EXPECT_EQ(compiled.status, Status::kExited) << compiled.exit_msg;
    EXPECT_EQ(compiled.exit_code, 0) << readFile(Path("stderr.txt"));
    return Run(language);
  }

  bool HasCompiler(Language language) const {
    return !CompileCommand(language).executable.empty();
  }

 private:
  std::unique_ptr<util::TempDir> tmp_;
};

const char* kHello = R"(
#include <stdio.h>
int main(void) {
  int x;
  if (scanf("%d", &x) != 1) return 1;
  printf("Hello %d\n", 2 * x);
  return 0;
}
)";

// NOLINTNEXTLINE
TEST_F(EngineTest, CompileAndRun) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict compiled = Compile(kHello);
  EXPECT_EQ(compiled.status, Status::kExited);
  EXPECT_EQ(compiled.exit_msg, "WIFEXITED WEXITSTATUS=0");
  EXPECT_TRUE(util::File::Exists(Path(kArtifact)));

  Verdict verdict = Run();
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_EQ(verdict.exit_code, 0);
  EXPECT_EQ(readFile(Path("stdout.txt")), "Hello 42\n");
  EXPECT_EQ(readFile(Path("stderr.txt")), "");
  std::vector<std::string> lines = readLines(Path("result.txt"));
  ASSERT_THAT(lines, SizeIs(4));
  EXPECT_EQ(lines[0], "Exited Normally");
  EXPECT_THAT(lines[1], StartsWith("WIFEXITED"));
  EXPECT_EQ(lines[2], std::to_string(verdict.duration_millis));
  EXPECT_EQ(lines[3], std::to_string(verdict.memory_kb));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, CompileAndRunCpp) {
  if (!HasCompiler(Language::kCpp)) GTEST_SKIP() << "g++ not found";
  Verdict verdict = CompileAndRun(R"(
#include <iostream>
#include <vector>
int main() {
  int x;
  std::cin >> x;
  std::vector<int> v(x, 2);
  int sum = 0;
  for (int y : v) sum += y;
  std::cout << sum << std::endl;
}
)",
                                  Language::kCpp);
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_EQ(readFile(Path("stdout.txt")), "42\n");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, CompilationError) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = Compile("int main(void) { return x; }\n");
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_NE(verdict.exit_code, 0);
  EXPECT_FALSE(util::File::Exists(Path(kArtifact)));
  EXPECT_THAT(readFile(Path("stderr.txt")), HasSubstr("error"));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, CompilationErrorRemovesStaleArtifact) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  std::ofstream(Path(kArtifact)) << "stale";
  Verdict verdict = Compile("this is not C\n");
  EXPECT_NE(verdict.exit_code, 0);
  EXPECT_FALSE(util::File::Exists(Path(kArtifact)));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, MissingCompiler) {
  setenv("PATH", Dir().c_str(), 1);
  Verdict verdict = Compile(kHello);
  EXPECT_EQ(verdict.status, Status::kSetupFailed);
  EXPECT_THAT(verdict.exit_msg, HasSubstr("no compiler found"));
  EXPECT_THAT(readLines(Path("result.txt")),
              ElementsAre("Sandbox Setup Failed", verdict.exit_msg, "0", "0"));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, RunWithoutArtifact) {
  Verdict verdict = Run();
  EXPECT_EQ(verdict.status, Status::kSetupFailed);
  EXPECT_THAT(verdict.exit_msg, StartsWith("chmod:"));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, Mutex) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <pthread.h>
#include <stdio.h>
static pthread_mutex_t lock = PTHREAD_MUTEX_INITIALIZER;
int main(void) {
  pthread_mutex_lock(&lock);
  puts("ok");
  pthread_mutex_unlock(&lock);
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_EQ(verdict.exit_code, 0);
  EXPECT_EQ(readFile(Path("stderr.txt")), "");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, GetRandom) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <stdio.h>
#include <sys/random.h>
int main(void) {
  unsigned char buf[32];
  return getrandom(buf, sizeof(buf), 0) == (ssize_t)sizeof(buf) ? 0 : 1;
}
)");
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_EQ(verdict.exit_code, 0);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, InfiniteLoop) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
int main(void) {
  volatile unsigned long x = 0;
  for (;;) x++;
}
)");
  EXPECT_EQ(verdict.status, Status::kTimedOut);
  EXPECT_LE(verdict.duration_millis, 3000);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, Sleep) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <unistd.h>
int main(void) {
  sleep(30);
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kTimedOut);
  EXPECT_THAT(verdict.exit_msg, HasSubstr("wall time"));
  EXPECT_LE(verdict.duration_millis, 3000);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, MemoryLimit) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <stdlib.h>
#include <string.h>
int main(void) {
  for (int i = 0; i < 200; i++) {
    char* p = malloc(1 << 20);
    if (p == NULL) return 1;
    memset(p, i, 1 << 20);
  }
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kMemoryExceeded);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, OutputLimit) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <stdio.h>
int main(void) {
  for (int i = 0; i < 100000; i++) printf("%d\n", i);
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kOutputExceeded);
  EXPECT_LE(util::File::Size(Path("stdout.txt")), 1 << 16);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, OutputLimitWithSigxfszIgnored) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <signal.h>
#include <stdio.h>
int main(void) {
  signal(SIGXFSZ, SIG_IGN);
  for (int i = 0; i < 100000; i++) printf("%d\n", i);
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kOutputExceeded);
  EXPECT_EQ(verdict.exit_msg, "WIFEXITED WEXITSTATUS=0");
  EXPECT_EQ(util::File::Size(Path("stdout.txt")), 1 << 16);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, OutputExactlyAtLimit) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <stdio.h>
int main(void) {
  for (int i = 0; i < (1 << 16); i++) putchar('x');
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_EQ(util::File::Size(Path("stdout.txt")), 1 << 16);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, ProcessLimit) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict compiled = Compile(R"(
#include <pthread.h>
#include <unistd.h>
void* idle(void* arg) {
  sleep(2);
  return arg;
}
int main(void) {
  pthread_attr_t attr;
  pthread_attr_init(&attr);
  pthread_attr_setstacksize(&attr, 1 << 16);
  pthread_t threads[32];
  for (int i = 0; i < 32; i++) {
    if (pthread_create(&threads[i], &attr, idle, NULL) != 0) return 3;
  }
  for (int i = 0; i < 32; i++) pthread_join(threads[i], NULL);
  return 0;
}
)");
  ASSERT_EQ(compiled.status, Status::kExited);
  ASSERT_EQ(compiled.exit_code, 0) << readFile(Path("stderr.txt"));

  ExecutionRequest request = Request(Language::kC, sandbox::Phase::kRun);
  request.time_limit_millis = 5000;
  request.process_limit = 4;
  Verdict verdict = Engine(request, Dir()).Run();
  if (getuid() == 0) {
    // RLIMIT_NPROC does not bind root, the watchdog does.
    EXPECT_EQ(verdict.status, Status::kProcessExceeded);
  } else {
    bool refused = verdict.status == Status::kExited && verdict.exit_code == 3;
    EXPECT_TRUE(verdict.status == Status::kProcessExceeded || refused)
        << StatusString(verdict) << " " << verdict.exit_msg;
  }
  EXPECT_LT(verdict.duration_millis, 2000);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, RestrictedFunction) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <stdio.h>
int main(void) {
  FILE* f = fopen("escaped.txt", "w");
  if (f != NULL) fputs("escaped", f);
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kRestricted);
  EXPECT_FALSE(util::File::Exists(Path("escaped.txt")));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, ForkIsRestricted) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <unistd.h>
int main(void) {
  fork();
  return 0;
}
)");
  EXPECT_EQ(verdict.status, Status::kRestricted);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, RuntimeError) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun(R"(
#include <stdlib.h>
int main(void) {
  abort();
}
)");
  EXPECT_EQ(verdict.status, Status::kSignaled);
  EXPECT_EQ(readLines(Path("result.txt"))[0], "Runtime Error (SIGABRT)");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, NonZeroExit) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict verdict = CompileAndRun("int main(void) { return 3; }\n");
  EXPECT_EQ(verdict.status, Status::kExited);
  EXPECT_EQ(verdict.exit_msg, "WIFEXITED WEXITSTATUS=3");
}

const char* kDeepRecursion = R"(
#include <stdio.h>
int depth(int n, volatile char* parent) {
  volatile char frame[1024];
  frame[0] = (char)(parent[0] + 1);
  if (n == 0) return frame[0];
  return depth(n - 1, frame) + frame[0];
}
int main(void) {
  volatile char root[1] = {0};
  printf("%d\n", depth(30000, root));
  return 0;
}
)";

// NOLINTNEXTLINE
TEST_F(EngineTest, LargeStack) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict compiled = Compile(kDeepRecursion);
  ASSERT_EQ(compiled.exit_code, 0);

  ExecutionRequest request = Request(Language::kC, sandbox::Phase::kRun);
  request.memory_limit_kb = 256 * 1024;
  request.large_stack = true;
  Verdict large = Engine(request, Dir()).Run();
  EXPECT_EQ(large.status, Status::kExited);

  request.large_stack = false;
  Verdict small = Engine(request, Dir()).Run();
  EXPECT_EQ(small.status, Status::kSignaled);
  EXPECT_EQ(small.signal, SIGSEGV);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, SameRequestSameStatus) {
  if (!HasCompiler(Language::kC)) GTEST_SKIP() << "gcc not found";
  Verdict first = CompileAndRun(kHello);
  Verdict second = Run();
  EXPECT_EQ(first.status, second.status);
  EXPECT_EQ(StatusString(first), StatusString(second));
}

}  // namespace
