#pragma once

#include <ednpath_tool/cli/Options.hpp>

namespace ednpath_tool::driver {

// Exit codes: 0 success, 1 not found / violations / reader errors, 2 usage.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

int run(const cli::Options& opt);

} // namespace ednpath_tool::driver
