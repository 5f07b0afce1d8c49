#pragma once

#include <string>

namespace tutorguard::cli {

[[nodiscard]] std::string version_string();

int run_cli(int argc, char **argv);

} // namespace tutorguard::cli
