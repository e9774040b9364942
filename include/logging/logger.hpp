#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        getLogger()->set_level(toSpdlogLevel(log_level));
    }

    static void setLevel(const std::string &log_level)
    {
        auto level = toSpdlogLevel(log_level);
        if (level == spdlog::level::info && log_level != "INFO" && log_level != "info")
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        getLogger()->set_level(level);
        debug("Log level changed to: " + log_level);
    }

    /**
     * @brief Mirror all log output into a file
     * @param file_path Log file, appended to if it exists
     */
    static void addFileSink(const std::string &file_path)
    {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
        getLogger()->sinks().push_back(sink);
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    // stderr keeps stdout free for scan reports
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stderr_color_mt("vidscan");
        return logger;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &log_level)
    {
        if (log_level == "TRACE" || log_level == "trace")
            return spdlog::level::trace;
        if (log_level == "DEBUG" || log_level == "debug")
            return spdlog::level::debug;
        if (log_level == "WARN" || log_level == "warn")
            return spdlog::level::warn;
        if (log_level == "ERROR" || log_level == "error")
            return spdlog::level::err;
        return spdlog::level::info;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
