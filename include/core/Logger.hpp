#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tempo {
  namespace core {

    enum class LogLevel { Debug, Info, Warn, Error };

    struct LogEvent {
      std::int64_t millis{ 0 }; ///< since epoch; 0 = stamp on enqueue
      LogLevel level{ LogLevel::Info };
      std::string component{};
      std::string message{};
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      explicit Logger(LogLevel minLevel = LogLevel::Info, std::size_t capacity = 4096);
      ~Logger(); ///< finishRun()

      // --- public API ---
      void startNewRun(const std::string& csvPath = {}); ///< open file (empty = std::clog) + launch worker thread
      void log(LogEvent event);                          ///< enqueue event (non-blocking)
      void finishRun();                                  ///< flush + join worker thread

      void debug(const std::string& component, const std::string& message);
      void info(const std::string& component, const std::string& message);
      void warn(const std::string& component, const std::string& message);
      void error(const std::string& component, const std::string& message);

      /// Events lost to a full buffer or logged while no run is active.
      std::size_t dropped() const { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      LogLevel minLevel_;
      std::ofstream csvFile_;
      std::ostream* out_{ nullptr };
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex runMutex_; ///< orders log() pushes against finishRun()
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace tempo
