#include "gelf/core/config.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

#include <simdjson.h>

namespace gelf
{

  namespace
  {

    template <typename T>
    using FieldResult = std::expected<std::optional<T>, ConfigError>;

    // NO_SUCH_FIELD is "not set"; any other error, including a wrong type, fails.
    template <typename T, typename Getter>
    FieldResult<T> get_optional(simdjson::ondemand::object &obj, std::string_view key,
                                Getter getter)
    {
      auto field = obj[key];
      if (field.error() == simdjson::NO_SUCH_FIELD)
      {
        return std::optional<T>{};
      }
      if (field.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      auto val = getter(field);
      if (val.error())
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      return std::optional<T>{T(val.value())};
    }

    FieldResult<std::string> get_optional_string(simdjson::ondemand::object &obj,
                                                 std::string_view key)
    {
      return get_optional<std::string>(obj, key, [](auto &field)
                                       { return field.get_string(); });
    }

    FieldResult<std::uint64_t> get_optional_uint(simdjson::ondemand::object &obj,
                                                 std::string_view key)
    {
      return get_optional<std::uint64_t>(obj, key, [](auto &field)
                                         { return field.get_uint64(); });
    }

    FieldResult<std::int64_t> get_optional_int(simdjson::ondemand::object &obj,
                                               std::string_view key)
    {
      return get_optional<std::int64_t>(obj, key, [](auto &field)
                                        { return field.get_int64(); });
    }

    std::expected<LoggingConfig, ConfigError>
    parse_logging(simdjson::ondemand::object &log, LoggingConfig base)
    {
      auto level = get_optional_string(log, "level");
      auto queue_size = get_optional_uint(log, "queue_size");
      auto drop_policy = get_optional_string(log, "drop_policy");
      auto output_path = get_optional_string(log, "output_path");

      if (!level || !queue_size || !drop_policy || !output_path)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }

      if (level->has_value())
      {
        auto parsed = logging::parse_log_level(**level);
        if (!parsed)
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.level = *parsed;
      }

      if (queue_size->has_value())
      {
        if (**queue_size == 0)
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.queue_size = static_cast<std::size_t>(**queue_size);
      }

      if (drop_policy->has_value())
      {
        auto parsed = logging::parse_drop_policy(**drop_policy);
        if (!parsed)
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.drop_policy = *parsed;
      }

      if (output_path->has_value())
      {
        if ((*output_path)->empty())
        {
          return std::unexpected(ConfigError::ParseFailed);
        }
        base.output_path = std::move(**output_path);
      }

      return base;
    }

  } // namespace

  const char *to_string(ConfigError error)
  {
    switch (error)
    {
    case ConfigError::FileOpenFailed:
      return "config file open failed";
    case ConfigError::ParseFailed:
      return "config parse failed";
    }
    return "unknown config error";
  }

  std::expected<Config, ConfigError> parse_config(std::string_view json)
  {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    simdjson::ondemand::document doc;
    if (parser.iterate(padded).get(doc))
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    simdjson::ondemand::object root;
    if (doc.get_object().get(root))
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    Config config;

    auto address = get_optional_string(root, "address");
    if (!address || !address->has_value() || (*address)->empty())
    {
      return std::unexpected(ConfigError::ParseFailed);
    }
    config.address = std::move(**address);

    auto compression = get_optional_string(root, "compression");
    auto level = get_optional_int(root, "compression_level");
    auto facility = get_optional_string(root, "facility");
    auto host = get_optional_string(root, "host");
    auto chunk_size = get_optional_uint(root, "chunk_size");
    auto timeout_ms = get_optional_uint(root, "http_timeout_ms");
    if (!compression || !level || !facility || !host || !chunk_size || !timeout_ms)
    {
      return std::unexpected(ConfigError::ParseFailed);
    }

    if (compression->has_value())
    {
      auto parsed = compress::parse_compression_type(**compression);
      if (!parsed)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      config.compression = *parsed;
    }

    if (level->has_value())
    {
      if (**level < compress::COMPRESSION_DEFAULT || **level > compress::COMPRESSION_BEST)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      config.compression_level = static_cast<int>(**level);
    }

    if (facility->has_value())
    {
      config.facility = std::move(**facility);
    }
    if (host->has_value())
    {
      config.host = std::move(**host);
    }

    if (chunk_size->has_value())
    {
      if (**chunk_size <= transport::CHUNK_HEADER_SIZE ||
          **chunk_size > transport::MAX_DATAGRAM_SIZE)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      config.chunk_size = static_cast<std::size_t>(**chunk_size);
    }

    if (timeout_ms->has_value())
    {
      if (**timeout_ms == 0)
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      config.http_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(**timeout_ms));
    }

    auto log = root["logging"];
    if (log.error() != simdjson::NO_SUCH_FIELD)
    {
      simdjson::ondemand::object log_obj;
      if (log.get_object().get(log_obj))
      {
        return std::unexpected(ConfigError::ParseFailed);
      }
      auto parsed = parse_logging(log_obj, config.logging);
      if (!parsed)
      {
        return std::unexpected(parsed.error());
      }
      config.logging = std::move(*parsed);
    }

    return config;
  }

  std::expected<Config, ConfigError> load_config(const std::string &path)
  {
    std::ifstream file(path);
    if (!file.is_open())
    {
      return std::unexpected(ConfigError::FileOpenFailed);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
  }

} // namespace gelf
