#include "pagedio/debug.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <unordered_set>

namespace {

struct LogState {
    std::mutex mutex;
    std::ofstream file;
    std::unordered_set<std::string> channels;
};

LogState& state() {
    static LogState s;
    return s;
}

std::vector<std::string> split_channels(const std::string& list) {
    std::vector<std::string> out;
    std::istringstream in(list);
    std::string channel;
    while (std::getline(in, channel, ',')) {
        if (!channel.empty()) out.push_back(channel);
    }
    return out;
}

// HH:MM:SS.micros
std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << micros;
    return out.str();
}

} // namespace

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!logfile.empty()) {
        if (s.file.is_open()) s.file.close();
        s.file.open(logfile, std::ios::out | std::ios::app);
    }
    s.channels.insert(channels.begin(), channels.end());
}

void Debug::init_from_env() {
    const char* channels = std::getenv("PAGEDIO_DEBUG");
    const char* logfile = std::getenv("PAGEDIO_LOGFILE");
    init(logfile ? logfile : "", split_channels(channels ? channels : ""));
}

void Debug::shutdown() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) s.file.close();
    s.channels.clear();
}

bool Debug::is_channel_enabled(const std::string& channel) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.channels.count("all") > 0 || s.channels.count(channel) > 0;
}

void Debug::emit(const char* channel, const char* function, int line, const std::string& message) {
    std::string entry = timestamp() + " [" + channel + "] " + function + ":" + std::to_string(line) + ": " + message;

    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    std::ostream& out = s.file.is_open() ? static_cast<std::ostream&>(s.file) : std::cout;
    out << entry << '\n';
    out.flush();
}
