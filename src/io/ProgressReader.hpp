#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "io/Source.hpp"
#include "io/FileSource.hpp"
#include "utils/Clock.hpp"

// pass-through Source that counts bytes read against a total size known upfront,
// and estimates time to completion from the average rate so far
//
// total_size is trusted as given: a source larger than announced makes fraction() exceed 1.0
// not thread-safe, use one reader per thread or lock externally
class ProgressReader : public Source {
    public:
    ProgressReader(std::unique_ptr<Source> source, size_t total_size, const Clock& clock = SteadyClock::instance());

    // total size from file metadata
    static ProgressReader from_file(std::unique_ptr<FileSource> file, const Clock& clock = SteadyClock::instance());
    static ProgressReader from_path(const std::filesystem::path& fname, const Clock& clock = SteadyClock::instance());

    // pinned: ProgressMeter keeps a reference
    ProgressReader(ProgressReader&&) = delete;
    ProgressReader& operator=(ProgressReader&&) = delete;

    using Source::read;
    size_t read(void* buf, size_t count) override;

    uint64_t bytes_read() const { return m_bytes_read; }
    size_t total_size() const { return m_total_size; }

    // bytes_read / total_size, 1.0 for an empty source
    double fraction() const;

    Clock::time_point start_time() const { return m_start_time; }
    Clock::duration elapsed() const;

    // average bytes per second since construction, 0 if not measurable yet
    double rate() const;

    // nullopt = unknown (nothing read yet, or no time elapsed)
    // estimates past the clock's range saturate at duration::max() / time_point::max()
    std::optional<Clock::duration> eta() const;
    std::optional<Clock::time_point> est_total_time() const;

    const Clock& clock() const { return *m_clock; }

    Source& inner() const;
    std::unique_ptr<Source> release();

    private:
    std::optional<Clock::duration> eta_at(Clock::time_point now) const;

        std::unique_ptr<Source> m_source;
        size_t m_total_size;
        uint64_t m_bytes_read = 0;
        const Clock* m_clock;
        Clock::time_point m_start_time;
};
