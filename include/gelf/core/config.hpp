#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "gelf/compress/compression.hpp"
#include "gelf/logging/log_level.hpp"
#include "gelf/logging/log_policy.hpp"
#include "gelf/transport/chunking.hpp"

namespace gelf
{

  /** Errors returned while loading a config file. */
  enum class ConfigError
  {
    FileOpenFailed,
    ParseFailed
  };

  [[nodiscard]] const char *to_string(ConfigError error);

  /** Diagnostic logger settings. */
  struct LoggingConfig
  {
    logging::LogLevel level = logging::LogLevel::Info;
    std::size_t queue_size = 10000;
    logging::DropPolicy drop_policy = logging::DropPolicy::DropOldest;
    std::string output_path = "logs/gelf_send.log.json";
  };

  /** Runtime configuration for gelf_send. */
  struct Config
  {
    std::string address;
    compress::CompressionType compression = compress::CompressionType::Gzip;
    int compression_level = compress::COMPRESSION_BEST_SPEED;
    // Empty means derive at startup.
    std::string facility;
    std::string host;
    std::size_t chunk_size = transport::CHUNK_SIZE;
    std::chrono::milliseconds http_timeout{10000};
    LoggingConfig logging;
  };

  /**
   * Parse config JSON text. Only "address" is required.
   * @param json Config document.
   * @return Parsed Config or ConfigError::ParseFailed.
   */
  [[nodiscard]] std::expected<Config, ConfigError> parse_config(std::string_view json);
  /**
   * Load and parse a config file.
   * @param path Path to the JSON file.
   * @return Parsed Config or ConfigError.
   */
  [[nodiscard]] std::expected<Config, ConfigError> load_config(const std::string &path);

} // namespace gelf
