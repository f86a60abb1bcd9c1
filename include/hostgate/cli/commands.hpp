#pragma once

namespace hostgate::cli {

int run_cli(int argc, char **argv);

} // namespace hostgate::cli
