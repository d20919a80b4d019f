#pragma once
#include <cstddef>
#include <string>

#include "io/ProgressReader.hpp"

// console status line for a ProgressReader, which must outlive the meter:
//   [⠋] 250Mb/1000Mb = 25.0%, 10s, 25Mb/s, eta: 30s
class ProgressMeter {
    public:
    explicit ProgressMeter(const ProgressReader& reader) : m_reader(reader), m_prev_time(reader.start_time()) {}

    // prints at most ~10 times per second unless final
    void update(bool final = false);
    void finish() { update(true); }

    std::string status() const;

    private:
    const ProgressReader& m_reader;
    Clock::time_point m_prev_time;
    size_t m_spinner_idx = 0;
    bool m_printed = false;
};
