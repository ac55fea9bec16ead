/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * logger.cpp - Implementation of the engine log sink
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lgate {

namespace {
    std::deque<std::string> system_logs;
    std::mutex log_mutex;
    bool console_echo = true;
}

void lgate_log(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (system_logs.size() >= LOG_RING_CAPACITY) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm;
    localtime_r(&now, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    system_logs.push_back(log_entry);

    if (console_echo) {
        std::cout << log_entry << std::endl;
    }
}

std::vector<std::string> lgate_recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void lgate_set_console_echo(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_echo = enabled;
}

} // namespace lgate
