#pragma once
#include <memory>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    using level = spdlog::level::level_enum;

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string banner){ m_banner = banner; }

    template <typename... Args>
    inline void log(spdlog::level::level_enum lvl, fmt::format_string<Args...> format, Args &&... args) {
        m_logger->log(lvl, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->error(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);
    const std::filesystem::path& file() const { return m_fname; }

    // show the banner and log destination
    void start();

    // get/set console level
    spdlog::level::level_enum console_level() const;
    void set_console_level(spdlog::level::level_enum level);

    void flush() { m_logger->flush(); }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_banner;
    std::filesystem::path m_fname;
};

// spdlog/fmt do not format std::filesystem::path by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
