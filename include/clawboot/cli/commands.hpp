#pragma once

#include "clawboot/config/environment.hpp"
#include "clawboot/process/process.hpp"

#include <string>
#include <vector>

namespace clawboot::cli {

int run_cli(int argc, char **argv);

/// `args` excludes the program name.
int run_cli(std::vector<std::string> args, const config::Environment &env,
            process::IProcessLauncher &launcher);

} // namespace clawboot::cli
