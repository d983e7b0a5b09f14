#pragma once

#include "boxrun/sandbox/docker.hpp"

#include <memory>

namespace boxrun::cli {

void print_help();

/// Entry point behind `main`. When `runner` is null a DockerCliRunner is built from the
/// configured docker binary.
int run_cli(int argc, char **argv, std::shared_ptr<sandbox::IDockerRunner> runner = nullptr);

} // namespace boxrun::cli
