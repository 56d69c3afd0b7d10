#include <cstdio>
#include <cstdlib>
#include <string>

// Writes argv[1] bytes to stdout with a single write.
int main(int argc, char** argv) {
  std::string data(atoi(argv[1]), 'x');
  fwrite(data.data(), 1, data.size(), stdout);
  return 0;
}
