#include <espresso/cli_exit_codes.h>

namespace espresso {

int BuildExitCode(const std::vector<BuildWarning> &warnings) {
  return warnings.empty() ? kExitSuccess : kExitWarnings;
}

} // namespace espresso
