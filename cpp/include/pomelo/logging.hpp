#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace pomelo {

constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e %^%5l%$ %v";
constexpr const char* ACCESS_LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e %v";
constexpr const char* ACCESS_LOGGER_NAME = "access";

// 安装默认 logger 和访问日志 logger. level 为 spdlog 级别名
void setupLogging(const std::string& level, bool access_log);

// 访问日志 logger, 关闭时返回 nullptr
std::shared_ptr<spdlog::logger> accessLogger();

} // namespace pomelo
