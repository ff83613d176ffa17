#include "log.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ShardCache
{
    std::shared_ptr<spdlog::logger> Logger()
    {
        static std::shared_ptr<spdlog::logger> logger = []()
        {
            auto logger = spdlog::get("shardcache");
            if (!logger)
            {
                logger = spdlog::stderr_color_mt("shardcache");
                logger->set_level(spdlog::level::warn);
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
                spdlog::cfg::load_env_levels();
            }
            return logger;
        }();
        return logger;
    }
}
