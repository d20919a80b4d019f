/**
 * @file ProgressMeter.cpp
 * @brief Console progress line for a ProgressReader.
 *
 * Shows bytes read out of the total, completion percentage, elapsed time,
 * average speed and estimated time remaining. The spinner uses Unicode
 * characters on Unix and ASCII characters on Windows.
 */

#include "ProgressMeter.hpp"
#include "common.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <string_view>

#ifdef _WIN32
static constexpr std::array<std::string_view, 4> SPINNER = {
    "|", "/", "-", "\\"
};
#else
static constexpr std::array<std::string_view, 10> SPINNER = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
};
#endif

static uint64_t to_seconds(Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

/**
 * @brief Builds the status line from the reader's current state.
 *
 * ETA is shown as "?" while it is unknown.
 */
std::string ProgressMeter::status() const {
    std::string eta = "?";
    if( auto left = m_reader.eta() ){
        eta = seconds2human(to_seconds(*left), 1);
    }

    return fmt::format("[{}] {}/{} = {:.1f}%, {}, {}/s, eta: {}",
        SPINNER[m_spinner_idx],
        bytes2human(m_reader.bytes_read(), "b"),
        bytes2human(m_reader.total_size(), "b"),
        100.0 * m_reader.fraction(),
        seconds2human(to_seconds(m_reader.elapsed())),
        bytes2human(static_cast<uint64_t>(m_reader.rate()), "b"),
        eta
        );
}

/**
 * @brief Redraws the status line in place.
 *
 * Throttled to ~10Hz by the reader's clock. The first call always prints.
 *
 * @param final If true, forces update and ends the line with a newline.
 */
void ProgressMeter::update(bool final){
    Clock::time_point now = m_reader.clock().now();
    if( m_printed && now - m_prev_time < std::chrono::milliseconds(100) && !final ){
        return;
    }
    m_prev_time = now;
    m_printed = true;

    fmt::print("{}" ANSI_CLEAR_EOL "{}", status(), final ? "\n" : "\r");
    fflush(stdout);

    if( ++m_spinner_idx >= SPINNER.size() ){
        m_spinner_idx = 0;
    }
}
