#pragma once

namespace textguard::cli {

/// Exit codes: 0 success, 1 usage or runtime error, 2 when a scan reaches
/// the configured fail level.
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitThreat = 2;

void print_help();
int run_cli(int argc, char **argv);

} // namespace textguard::cli
