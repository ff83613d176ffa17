#ifndef SHARDCACHE_LOG_H
#define SHARDCACHE_LOG_H

#include <spdlog/spdlog.h>
#include <memory>

namespace ShardCache
{
    // Process-wide "shardcache" logger on stderr. The level defaults to warn
    // and follows SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=shardcache=debug).
    std::shared_ptr<spdlog::logger> Logger();
}

#endif
