#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace gateway {

namespace {

std::mutex g_logMutex;
LogLevel g_level = LogLevel::Info;
std::ofstream g_errorFile;
std::ofstream g_accessFile;
std::ostream* g_errorOut = &std::cout;
std::ostream* g_accessOut = nullptr;
bool g_accessEnabled = true;

std::ostream* openSink(const std::string& target, std::ofstream& file) {
    if (target.empty() || target == "stdout") {
        return &std::cout;
    }
    if (target == "stderr") {
        return &std::cerr;
    }
    if (file.is_open()) {
        file.close();
    }
    file.open(target, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + target);
    }
    return &file;
}

void writeLine(std::ostream& out, const std::string& text) {
    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    out << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] " << text << std::endl;
}

} // namespace

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info" || lower == "notice") out = LogLevel::Info;
    else if (lower == "warn") out = LogLevel::Warn;
    else if (lower == "error" || lower == "crit") out = LogLevel::Error;
    else return false;
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_level = level;
}

void Logger::openErrorLog(const std::string& target) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_errorOut = openSink(target, g_errorFile);
}

void Logger::openAccessLog(const std::string& target) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_accessOut = openSink(target, g_accessFile);
    g_accessEnabled = true;
}

void Logger::disableAccessLog() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_accessEnabled = false;
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_errorFile.is_open()) g_errorFile.close();
    if (g_accessFile.is_open()) g_accessFile.close();
    g_errorOut = &std::cout;
    g_accessOut = nullptr;
    g_accessEnabled = true;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level < g_level) {
        return;
    }
    std::ostringstream line;
    line << std::left << std::setw(5) << logLevelName(level) << " " << message;
    writeLine(*g_errorOut, line.str());
}

void Logger::access(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!g_accessEnabled) {
        return;
    }
    writeLine(g_accessOut ? *g_accessOut : *g_errorOut, line);
}

} // namespace gateway
