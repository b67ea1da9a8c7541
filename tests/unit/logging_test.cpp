#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/observability/logging.hpp"

namespace {

using namespace subnet::observability;

void TestPlainFieldsAreSpaceSeparated() {
  const auto line = FormatFields({NetworkField(3), UintField("pot", 1000), BoolField("recycled", false)});
  assert(line == "netuid=3 pot=1000 recycled=false");
}

void TestValuesNeedingQuotesAreQuoted() {
  assert(FormatFields({StringField("owner", "")}) == "owner=\"\"");
  assert(FormatFields({StringField("reason", "network missing")}) == "reason=\"network missing\"");
  assert(FormatFields({StringField("k", "a=b")}) == "k=\"a=b\"");
  assert(FormatFields({StringField("k", "say \"hi\"")}) == "k=\"say \\\"hi\\\"\"");
}

void TestMacrosWriteThroughDefaultLogger() {
  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("logging_test", sink);
  logger->set_pattern("[%l] %v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  SUBNET_LOG_WARN("dissolution rejected", {NetworkField(42), StringField("state", "rejected")});
  SUBNET_LOG_INFO("startup");
  logger->flush();

  const auto text = out.str();
  assert(text.find("[warning] dissolution rejected netuid=42 state=rejected") != std::string::npos);
  assert(text.find("[info] startup\n") != std::string::npos);
}

} // namespace

int main() {
  TestPlainFieldsAreSpaceSeparated();
  TestValuesNeedingQuotesAreQuoted();
  TestMacrosWriteThroughDefaultLogger();
  std::cout << "subnet_manager_unit_logging: pass\n";
  return 0;
}
