#include "logger.h"
#include "constants.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <vector>
#include <mutex>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace runbox {

namespace {

std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
std::string g_log_dir;
std::string g_file_date;   // Date of the currently open file
size_t g_file_part = 0;    // 0: <date>.log, N: <date>.N.log
uintmax_t g_file_bytes = 0;
uintmax_t g_max_file_bytes = LOG_MAX_FILE_BYTES;
std::ofstream g_file;

std::tm local_now() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    return tm_buf;
}

std::string format_time(const std::tm& tm_buf, const char* fmt) {
    std::ostringstream out;
    out << std::put_time(&tm_buf, fmt);
    return out.str();
}

std::string part_path(const std::string& date, size_t part) {
    std::string name = part == 0 ? date + ".log" : date + "." + std::to_string(part) + ".log";
    return g_log_dir + "/" + name;
}

// Caller holds g_log_mutex
void open_part(const std::string& date, size_t part) {
    g_file.close();
    std::string path = part_path(date, part);
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    g_file_bytes = ec ? 0 : size;
    g_file.open(path, std::ios::app);
    g_file_date = date;
    g_file_part = part;
}

// Caller holds g_log_mutex
void write_file_line(const std::string& date, const std::string& line) {
    if (g_log_dir.empty()) return;

    if (!g_file.is_open() || g_file_date != date) {
        // Resume at the first part of the day that still has room
        size_t part = 0;
        while (true) {
            std::error_code ec;
            uintmax_t size = fs::file_size(part_path(date, part), ec);
            if (ec || size < g_max_file_bytes) break;
            part++;
        }
        open_part(date, part);
    } else if (g_file_bytes >= g_max_file_bytes) {
        open_part(date, g_file_part + 1);
    }

    if (g_file) {
        g_file << line << '\n';
        g_file.flush();
        g_file_bytes += line.size() + 1;
    }
}

// Chronological order: by date, then by part number
std::pair<std::string, unsigned long> log_order(const fs::path& path) {
    std::string stem = path.stem().string();
    size_t dot = stem.find('.');
    if (dot == std::string::npos) return {stem, 0};
    try {
        return {stem.substr(0, dot), std::stoul(stem.substr(dot + 1))};
    } catch (const std::exception&) {
        return {stem, 0};
    }
}

} // namespace

void Logger::set_level(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_level;
}

void Logger::set_log_dir(const std::string& dir) {
    if (!dir.empty()) {
        fs::create_directories(dir);
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_file.close();
    g_file_date.clear();
    g_log_dir = dir;
}

void Logger::set_max_file_size(uintmax_t bytes) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_max_file_bytes = bytes;
}

void Logger::prune_old_logs(int keep) {
    std::string dir;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        dir = g_log_dir;
    }
    if (dir.empty() || !fs::exists(dir)) return;

    std::vector<fs::path> logs;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            logs.push_back(entry.path());
        }
    }
    if (static_cast<int>(logs.size()) <= keep) return;

    std::sort(logs.begin(), logs.end(), [](const fs::path& a, const fs::path& b) {
        return log_order(a) < log_order(b);
    });
    size_t excess = logs.size() - static_cast<size_t>(keep);
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        fs::remove(logs[i], ec);
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message) {
    std::tm tm_buf = local_now();
    return format_time(tm_buf, "%Y-%m-%d %H:%M:%S") + " [" + level_to_string(level) + "]: " + message;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        std::tm tm_buf = local_now();
        std::string line = format_time(tm_buf, "%Y-%m-%d %H:%M:%S") +
                           " [" + level_to_string(level) + "]: " + message;

        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(g_level)) {
            return;
        }
        std::cout << line << std::endl;
        write_file_line(format_time(tm_buf, "%Y-%m-%d"), line);
    } catch (const std::exception& e) {
        // Logging must never take down the caller
        std::cerr << "logger failure: " << e.what() << std::endl;
    }
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = name;
    for (auto& c : lower) c = static_cast<char>(tolower(c));

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "UNKNOWN";
}

} // namespace runbox
