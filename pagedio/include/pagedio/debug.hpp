#pragma once
#include <sstream>
#include <string>
#include <vector>

// Process wide diagnostic log split into named channels ("file", "pagepool",
// "reader", or "all"). Output goes to the configured log file, else stdout.
class Debug {
public:
    static void init(const std::string& logfile, const std::vector<std::string>& channels);

    // PAGEDIO_DEBUG holds comma separated channels, PAGEDIO_LOGFILE the target file.
    static void init_from_env();
    static void shutdown();

    static bool is_channel_enabled(const std::string& channel);

    template<typename... Args>
    static void log(const char* channel, const char* function, int line, const Args&... args) {
        std::ostringstream message;
        (message << ... << args);
        emit(channel, function, line, message.str());
    }

private:
    static void emit(const char* channel, const char* function, int line, const std::string& message);
};

// Arguments are only evaluated when the channel is enabled.
#define DEBUG_LOG(channel, ...) \
    do { \
        if (Debug::is_channel_enabled(channel)) { \
            Debug::log(channel, __FUNCTION__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)
