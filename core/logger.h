/*
 * This file is part of Letterpress.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Letterpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Letterpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Letterpress. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// Asynchronous logger that writes timestamped messages to stderr and a log
// file. The file is "letterpress.log" in the working directory unless
// LETTERPRESS_LOG_FILE names another one.
class Logger {
public:
  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Queue a message to be logged.
  void Log(const std::string &msg);

  // Block until every queued message has been written.
  void Flush();

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();
  static std::string Timestamp();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::queue<std::string> queue_;
  bool writing_ = false;
  bool done_ = false;
  std::thread worker_;
};
