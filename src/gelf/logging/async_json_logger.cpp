#include "gelf/logging/async_json_logger.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>

#include "gelf/record/record_codec.hpp"

namespace gelf::logging
{

  namespace
  {

    constexpr std::string_view LOGGER_COMPONENT = "logging";

    std::uint64_t now_ms()
    {
      return static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
              .count());
    }

  } // namespace

  AsyncJsonLogger::AsyncJsonLogger(AsyncJsonLoggerOptions options)
      : options_(std::move(options)), out_(open_output())
  {
    writer_ = std::thread(&AsyncJsonLogger::writer_loop, this);
  }

  AsyncJsonLogger::~AsyncJsonLogger()
  {
    {
      std::scoped_lock lock(mutex_);
      closing_ = true;
    }
    wake_.notify_all();
    if (writer_.joinable())
    {
      writer_.join();
    }
  }

  std::ostream &AsyncJsonLogger::open_output()
  {
    std::filesystem::path path(options_.output_path);
    if (path.has_parent_path())
    {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
    }
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open())
    {
      return std::cerr;
    }
    return file_;
  }

  void AsyncJsonLogger::log(LogEvent event)
  {
    if (!should_log(event.level, options_.level))
    {
      return;
    }
    if (event.ts_ms == 0)
    {
      event.ts_ms = now_ms();
    }

    std::scoped_lock lock(mutex_);
    if (pending_.size() >= options_.queue_size)
    {
      dropped_.fetch_add(1);
      if (options_.drop_policy == DropPolicy::DropNewest)
      {
        return;
      }
      pending_.pop_front();
    }
    pending_.push_back(std::move(event));
    wake_.notify_one();
  }

  void AsyncJsonLogger::writer_loop()
  {
    bool closing = false;
    while (!closing)
    {
      std::deque<LogEvent> ready;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait(lock, [this]
                   { return closing_ || !pending_.empty(); });
        closing = closing_;
        ready.swap(pending_);
      }

      for (const auto &event : ready)
      {
        emit(event);
      }
      if (auto dropped = dropped_.exchange(0); dropped > 0)
      {
        emit_drop_summary(dropped);
      }
      out_.flush();
    }
  }

  std::optional<std::string> AsyncJsonLogger::format_line(const LogEvent &event) const
  {
    auto encoded = record::encode(to_record(event, options_.host));
    if (encoded)
    {
      return std::move(*encoded);
    }

    // The event's own fields are unencodable; keep its message and the reason.
    LogFields fields;
    fields.add_string("reason", record::to_string(encoded.error()));
    fields.add_string("component", event.component);
    LogEvent replacement{.ts_ms = event.ts_ms,
                         .level = LogLevel::Error,
                         .component = std::string(LOGGER_COMPONENT),
                         .message = "unencodable_log_event",
                         .detail = event.message,
                         .fields = std::move(fields)};
    auto fallback = record::encode(to_record(replacement, options_.host));
    if (!fallback)
    {
      return std::nullopt;
    }
    return std::move(*fallback);
  }

  void AsyncJsonLogger::emit(const LogEvent &event)
  {
    auto line = format_line(event);
    if (!line)
    {
      return;
    }
    line->push_back('\n');
    out_ << *line;
    lines_written_.fetch_add(1);
  }

  void AsyncJsonLogger::emit_drop_summary(std::uint64_t dropped)
  {
    LogFields fields;
    fields.add_uint("dropped", dropped);
    emit(LogEvent{.ts_ms = now_ms(),
                  .level = LogLevel::Warning,
                  .component = std::string(LOGGER_COMPONENT),
                  .message = "dropped_logs",
                  .detail = {},
                  .fields = std::move(fields)});
  }

} // namespace gelf::logging
