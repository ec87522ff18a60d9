/* @file Logger.cpp
 * @brief background CSV writer fed through a RingBuffer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>

// Tempo headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace tempo::core;

namespace {

  const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    }
    return "UNKNOWN";
  }

  std::string quoteCsv(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  std::int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }

} // namespace

Logger::Logger(LogLevel minLevel, std::size_t capacity)
    : minLevel_(minLevel), buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  std::lock_guard<std::mutex> lock(runMutex_);
  if (running_)
    return;

  if (csvPath.empty()) {
    out_ = &std::clog;
  } else {
    csvFile_.open(csvPath, std::ios::out | std::ios::trunc);
    if (!csvFile_)
      throw std::runtime_error("[Logger] cannot open " + csvPath);
    out_ = &csvFile_;
    *out_ << "millis,level,component,message\n";
  }

  running_ = true;
  worker_ = std::thread([this] { drain(); });
}

void Logger::log(LogEvent event) {
  if (event.level < minLevel_)
    return;
  if (event.millis == 0)
    event.millis = nowMillis();

  // a push that passes the running check must land before drain() can exit
  std::lock_guard<std::mutex> lock(runMutex_);
  if (!running_ || !buffer_->tryPush(std::move(event)))
    ++dropped_;
}

void Logger::finishRun() {
  {
    std::lock_guard<std::mutex> lock(runMutex_);
    if (!running_.exchange(false))
      return;
  }
  if (worker_.joinable())
    worker_.join();
  out_->flush();
  if (csvFile_.is_open())
    csvFile_.close();
  out_ = nullptr;
}

void Logger::drain() {
  while (running_ || !buffer_->empty()) {
    auto event = buffer_->pop(std::chrono::milliseconds{ 50 });
    if (!event)
      continue;
    *out_ << event->millis << ',' << toString(event->level) << ',' << quoteCsv(event->component) << ','
          << quoteCsv(event->message) << '\n';
  }
}

void Logger::debug(const std::string& component, const std::string& message) {
  log(LogEvent{ 0, LogLevel::Debug, component, message });
}

void Logger::info(const std::string& component, const std::string& message) {
  log(LogEvent{ 0, LogLevel::Info, component, message });
}

void Logger::warn(const std::string& component, const std::string& message) {
  log(LogEvent{ 0, LogLevel::Warn, component, message });
}

void Logger::error(const std::string& component, const std::string& message) {
  log(LogEvent{ 0, LogLevel::Error, component, message });
}
