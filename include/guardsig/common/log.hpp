#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace guardsig {

// Shared "guardsig" logger, created on first use.
std::shared_ptr<spdlog::logger> GetLogger();

// Returns `logger` when set, otherwise the shared logger.
std::shared_ptr<spdlog::logger> LoggerOrDefault(std::shared_ptr<spdlog::logger> logger);

}  // namespace guardsig
