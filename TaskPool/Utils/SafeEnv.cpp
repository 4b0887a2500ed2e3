#include "SafeEnv.h"
#include <cstdlib>
#include <mutex>

namespace taskpool::env
{
    namespace {
        // getenv is not guaranteed to be safe against concurrent readers on every libc
        std::mutex g_env_mutex;
    }

    std::optional<std::string> getenv_safe(const char* name)
    {
        if (!name || !*name) return std::nullopt;
        std::lock_guard<std::mutex> lk(g_env_mutex);
        const char* val = std::getenv(name);
        if (!val) return std::nullopt;
        return std::string(val);
    }
}
