#pragma once
#include <atomic>
#include <boost/log/trivial.hpp>
#include <memory>
#include <string>

#include "weave/log/log_config.hpp"

namespace weave::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

    /**
     * @brief Filter out records below info, unless the level was already
     * chosen through init() or set_level()
     *
     * Only the first call has an effect.
     */
    static void install_default_filter();

    // Translates spdlog-style patterns ("[%l] %v") to Boost.Log placeholders.
    static std::string normalize_pattern(std::string pattern);

private:
    static void apply_filter(LogConfig::LogLevel level);

    static LogConfig config_;
    static std::atomic<bool> configured_;
};

}  // namespace weave::log

#define WEAVE_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define WEAVE_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define WEAVE_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define WEAVE_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define WEAVE_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define WEAVE_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
