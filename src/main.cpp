#include "gelf/app/app_context.hpp"
#include "gelf/logging/log_fields.hpp"
#include "gelf/logging/log_level.hpp"
#include "gelf/record/text_record.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace
{

  constexpr std::string_view DEFAULT_CONFIG_PATH = "config.json";

} // namespace

// Forwards each non-empty stdin line to the configured GELF server.
int main(int argc, char **argv)
{
  std::string_view config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
  std::string_view program = argc > 0 ? argv[0] : "";

  auto ctx = gelf::app::AppContext::build(config_path, program);
  if (!ctx)
  {
    return 1;
  }
  ctx->log_config();

  std::uint64_t line_number = 0;
  std::uint64_t sent = 0;
  std::uint64_t failed = 0;
  std::string line;
  while (std::getline(std::cin, line))
  {
    ++line_number;
    if (gelf::record::trim_text(line).empty())
    {
      continue;
    }

    auto record = gelf::record::make_text_record(line, ctx->host(), ctx->facility(),
                                                 std::chrono::system_clock::now());
    auto result = ctx->writer().send(record);
    if (!result)
    {
      ++failed;
      gelf::logging::LogFields fields;
      fields.add_string("error", gelf::transport::to_string(result.error()));
      fields.add_uint("line_number", line_number);
      ctx->logger().log(gelf::logging::LogLevel::Error, "transport.send", "send_failed",
                        std::move(fields));
      continue;
    }
    ++sent;
  }

  gelf::logging::LogFields summary;
  summary.add_uint("sent", sent);
  summary.add_uint("failed", failed);
  ctx->logger().log(gelf::logging::LogLevel::Info, "app", "input_done", std::move(summary));

  return failed == 0 ? 0 : 1;
}
