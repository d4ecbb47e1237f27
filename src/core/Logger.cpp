/* @file Logger.cpp
 * @brief worker-thread CSV event writer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <stdexcept>

// pledge headers
#include "core/LogEvent.hpp"
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace pledge::core;

namespace {
  constexpr std::chrono::milliseconds kDrainInterval{ 50 };
  constexpr const char* kCsvHeader = "timestamp_ms,campaign,kind,subject,amount,detail\n";
} // namespace

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    throw std::runtime_error("[Logger] run already in progress");

  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open event log: " + csvPath);
  csvFile_.write(kCsvHeader);

  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
}

void Logger::log(const LogEvent& event) { buffer_->push(event); }

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;

  buffer_->wake();
  if (worker_.joinable())
    worker_.join();

  // anything enqueued after the worker's last pass
  writeBatch();
  if (!csvFile_.flush())
    std::cerr << "[Logger] final flush failed\n";
  csvFile_.close();
}

std::size_t Logger::dropped() const { return buffer_->dropped(); }

void Logger::workerLoop() {
  while (running_)
    writeBatch();
}

void Logger::writeBatch() {
  auto batch = buffer_->drain(running_ ? kDrainInterval : std::chrono::milliseconds{ 0 });
  if (batch.empty())
    return;
  for (const auto& ev : batch)
    csvFile_.write(ev.toCsv());
  if (!csvFile_.flush())
    std::cerr << "[Logger] flush failed, " << batch.size() << " events may be lost\n";
}
