#include "guardsig/common/log.hpp"

#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace guardsig {
namespace {

constexpr char kLoggerName[] = "guardsig";

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger() {
  static std::mutex mu;
  std::lock_guard<std::mutex> lock(mu);

  std::shared_ptr<spdlog::logger> logger = spdlog::get(kLoggerName);
  if (logger == nullptr) {
    logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  }
  return logger;
}

std::shared_ptr<spdlog::logger> LoggerOrDefault(std::shared_ptr<spdlog::logger> logger) {
  if (logger != nullptr) {
    return logger;
  }
  return GetLogger();
}

}  // namespace guardsig
