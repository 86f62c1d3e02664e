#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "gelf/logging/log_event.hpp"
#include "gelf/logging/log_policy.hpp"
#include "gelf/logging/logger.hpp"

namespace gelf::logging
{

  struct AsyncJsonLoggerOptions
  {
    LogLevel level = LogLevel::Info;
    // Events held before the drop policy applies.
    std::size_t queue_size = 10000;
    DropPolicy drop_policy = DropPolicy::DropOldest;
    std::string output_path = "logs/gelf_send.log.json";
    // host field of every written record.
    std::string host;
  };

  /**
   * Diagnostic logger that appends one GELF JSON record per line.
   * Encoding and file I/O happen on a background thread; callers only
   * enqueue. Output goes to stderr when output_path cannot be opened.
   */
  class AsyncJsonLogger : public Logger
  {
  public:
    explicit AsyncJsonLogger(AsyncJsonLoggerOptions options);
    /** Writes everything still queued, then joins the writer thread. */
    ~AsyncJsonLogger() override;

    AsyncJsonLogger(const AsyncJsonLogger &) = delete;
    AsyncJsonLogger &operator=(const AsyncJsonLogger &) = delete;
    AsyncJsonLogger(AsyncJsonLogger &&) = delete;
    AsyncJsonLogger &operator=(AsyncJsonLogger &&) = delete;

    using Logger::log;

    /**
     * Queue an event. Events below the configured level are discarded.
     * @param event Event to write; ts_ms == 0 is stamped with the current time.
     */
    void log(LogEvent event) override;
    [[nodiscard]] LogLevel level() const override { return options_.level; }

    /** Lines written so far, including drop summaries. */
    [[nodiscard]] std::uint64_t lines_written() const { return lines_written_.load(); }

  private:
    void writer_loop();
    void emit(const LogEvent &event);
    void emit_drop_summary(std::uint64_t dropped);
    [[nodiscard]] std::optional<std::string> format_line(const LogEvent &event) const;
    std::ostream &open_output();

    const AsyncJsonLoggerOptions options_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<LogEvent> pending_;
    bool closing_ = false;
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> lines_written_{0};

    std::ofstream file_;
    std::ostream &out_;
    std::thread writer_;
  };

} // namespace gelf::logging
