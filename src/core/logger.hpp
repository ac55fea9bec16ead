/*
 * LedgerGate: Period Lock & Posting Engine
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * logger.hpp - Engine log sink
 * Writes to stdout and keeps the most recent lines for the admin log viewer.
 */

#ifndef LGATE_LOGGER_HPP
#define LGATE_LOGGER_HPP

#include <string>
#include <vector>

namespace lgate {

// Lines retained for GET /api/system/logs
constexpr size_t LOG_RING_CAPACITY = 200;

// level: DEBUG, INFO, WARN, ERROR, CRITICAL, FATAL
void lgate_log(const std::string& level, const std::string& message);

// Snapshot of the retained lines, oldest first.
std::vector<std::string> lgate_recent_logs();

// Silences stdout (tests); the ring buffer keeps recording.
void lgate_set_console_echo(bool enabled);

} // namespace lgate

#endif // LGATE_LOGGER_HPP
