#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV event logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace pledge {
  namespace core {

    struct LogEvent;                        // defined in core/LogEvent.hpp
    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Event sink for external observers (Created, Contributed, Closed, ...).
 *
 *  * `log()` only enqueues; the worker thread owns all file I/O.
 *  * Events logged before `startNewRun()` stay buffered (oldest dropped when full)
 *    and are written once a run starts.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 4096);
      virtual ~Logger(); ///< finishes a running run

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      virtual void log(const LogEvent& event);      ///< enqueue event (non-blocking)
      void finishRun();                             ///< flush + join worker thread

      bool running() const { return running_; }
      std::size_t dropped() const; ///< events lost to a full buffer

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void writeBatch();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace pledge
