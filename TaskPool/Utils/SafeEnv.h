#pragma once
#include <optional>
#include <string>

namespace taskpool::env
{
    // Copy of the variable's value, or nullopt when it is unset.
    std::optional<std::string> getenv_safe(const char* name);
}
