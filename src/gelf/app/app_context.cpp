#include "gelf/app/app_context.hpp"

#include <filesystem>
#include <iostream>

namespace gelf::app
{

const char* to_string(AppError error)
{
  switch (error)
  {
  case AppError::ConfigLoadFailed:
    return "config load failed";
  case AppError::HostnameFailed:
    return "local hostname lookup failed";
  case AppError::WriterFailed:
    return "writer creation failed";
  }
  return "unknown app error";
}

std::expected<AppContext, AppError> AppContext::build(std::string_view config_path,
                                                      std::string_view program)
{
  auto config_result = gelf::load_config(std::string(config_path));
  if (!config_result)
  {
    std::cerr << "config load failed: " << gelf::to_string(config_result.error()) << std::endl;
    return std::unexpected(AppError::ConfigLoadFailed);
  }

  auto writer_options = gelf::transport::with_defaults(build_writer_options(*config_result, program));
  if (!writer_options)
  {
    std::cerr << gelf::transport::to_string(writer_options.error()) << std::endl;
    return std::unexpected(AppError::HostnameFailed);
  }

  auto logger = std::make_unique<gelf::logging::AsyncJsonLogger>(
      build_logger_options(*config_result, writer_options->host));

  auto host = writer_options->host;
  auto facility = writer_options->facility;
  auto writer = gelf::transport::make_writer(std::move(*writer_options));
  if (!writer)
  {
    gelf::logging::LogFields fields;
    fields.add_string("error", gelf::transport::to_string(writer.error()));
    fields.add_string("address", config_result->address);
    logger->log(gelf::logging::LogLevel::Error, "transport.writer", "writer_failed", std::move(fields));
    return std::unexpected(AppError::WriterFailed);
  }

  return AppContext(std::move(*config_result),
                    std::move(logger),
                    std::move(*writer),
                    std::move(host),
                    std::move(facility));
}

void AppContext::log_config() const
{
  gelf::logging::LogFields fields;
  fields.add_string("address", config_.address);
  fields.add_string("compression", std::string(gelf::compress::to_string(config_.compression)));
  fields.add_int("compression_level", config_.compression_level);
  fields.add_uint("chunk_size", config_.chunk_size);
  fields.add_string("facility", facility_);
  logger_->log(gelf::logging::LogLevel::Info, "core.config", "writer_config", std::move(fields));
}

gelf::transport::WriterOptions AppContext::build_writer_options(const gelf::Config& config,
                                                                std::string_view program)
{
  std::string facility = config.facility;
  if (facility.empty() && !program.empty())
  {
    facility = std::filesystem::path(program).filename().string();
  }

  return gelf::transport::WriterOptions{.address = config.address,
                                        .compression_type = config.compression,
                                        .compression_level = config.compression_level,
                                        .facility = std::move(facility),
                                        .host = config.host,
                                        .chunk_size = config.chunk_size,
                                        .http_timeout = config.http_timeout};
}

gelf::logging::AsyncJsonLoggerOptions AppContext::build_logger_options(const gelf::Config& config,
                                                                       std::string host)
{
  return gelf::logging::AsyncJsonLoggerOptions{.level = config.logging.level,
                                               .queue_size = config.logging.queue_size,
                                               .drop_policy = config.logging.drop_policy,
                                               .output_path = config.logging.output_path,
                                               .host = std::move(host)};
}

} // namespace gelf::app
