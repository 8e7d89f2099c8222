#include <op_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace op_mcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool UseColorLogs() {
    return IsStderrTty() && !NoColorEnvSet();
}

} // namespace op_mcp
