#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace subnet::runtime::config {
class RuntimeConfig;
}

namespace subnet::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);
// Every ledger event about one network carries it under the same key.
LogField NetworkField(model::NetworkId netuid);

// key=value pairs joined by spaces; values with spaces, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const subnet::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace subnet::observability

#define SUBNET_LOG_INFO(message, ...) ::subnet::observability::LogInfo((message), ##__VA_ARGS__)
#define SUBNET_LOG_WARN(message, ...) ::subnet::observability::LogWarn((message), ##__VA_ARGS__)
#define SUBNET_LOG_ERROR(message, ...) ::subnet::observability::LogError((message), ##__VA_ARGS__)
