#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

int32_t Flags::uid = -1;
int32_t Flags::gid = -1;

bool Flags::keep_artifact = false;
