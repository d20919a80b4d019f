/**
 * @file Logger.cpp
 * @brief Logger wrapper around spdlog.
 *
 * Console logging with integer verbosity levels and an optional log file added
 * at runtime, keeping DEBUG in the file while the console stays at its own level.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <array>
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 */
void Logger::set_verbosity(int verbosity){
    static constexpr std::array<spdlog::level::level_enum, 7> levels = {
        spdlog::level::off,
        spdlog::level::critical,
        spdlog::level::err,
        spdlog::level::warn,
        spdlog::level::info, // default
        spdlog::level::debug,
        spdlog::level::trace,
    };
    m_logger->set_level(levels[std::clamp(verbosity, -4, 2) + 4]);
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file gets DEBUG or higher, console keeps the current level. A second call
 * is ignored. The file is opened in append mode, sessions separated by a blank line.
 *
 * @param fname Path to the log file.
 * @return True if file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    // if current logger level is DEBUG or TRACE => file level just inherits it
    // otherwise, file level is DEBUG
    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level()); // move current level to console sink
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->info("{}", m_banner);
    }
    m_logger->info("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level); // XXX assuming that first sink is console
}

spdlog::level::level_enum Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
