#pragma once

#include "gelf/core/config.hpp"
#include "gelf/logging/async_json_logger.hpp"
#include "gelf/transport/writer.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace gelf::app
{

/**
 * Errors encountered while building app context.
 */
enum class AppError
{
  ConfigLoadFailed,
  HostnameFailed,
  WriterFailed
};

[[nodiscard]] const char* to_string(AppError error);

/**
 * Application context: config, diagnostic logger and the GELF writer.
 */
class AppContext
{
public:
  /**
   * Build application context from a config path.
   * @param config_path Path to config file.
   * @param program argv[0]; its basename is the default facility.
   * @return AppContext or AppError.
   */
  [[nodiscard]] static std::expected<AppContext, AppError> build(std::string_view config_path,
                                                                 std::string_view program);

  /**
   * Access the diagnostic logger.
   * @return Logger reference.
   */
  [[nodiscard]] gelf::logging::Logger& logger() const
  {
    return *logger_;
  }

  /**
   * Access the GELF writer.
   * @return Writer reference.
   */
  [[nodiscard]] gelf::transport::Writer& writer() const
  {
    return *writer_;
  }

  [[nodiscard]] const gelf::Config& config() const
  {
    return config_;
  }

  [[nodiscard]] const std::string& host() const
  {
    return host_;
  }

  [[nodiscard]] const std::string& facility() const
  {
    return facility_;
  }

  /**
   * Log config summary to the logger.
   */
  void log_config() const;

private:
  AppContext(gelf::Config config,
             std::unique_ptr<gelf::logging::AsyncJsonLogger> logger,
             std::unique_ptr<gelf::transport::Writer> writer,
             std::string host,
             std::string facility)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      writer_(std::move(writer)),
      host_(std::move(host)),
      facility_(std::move(facility))
  {
  }

  [[nodiscard]] static gelf::transport::WriterOptions build_writer_options(
      const gelf::Config& config, std::string_view program);

  [[nodiscard]] static gelf::logging::AsyncJsonLoggerOptions build_logger_options(
      const gelf::Config& config, std::string host);

  gelf::Config config_;
  std::unique_ptr<gelf::logging::AsyncJsonLogger> logger_;
  std::unique_ptr<gelf::transport::Writer> writer_;
  std::string host_;
  std::string facility_;
};

} // namespace gelf::app
