/**
 * @file ProgressReader.cpp
 * @brief Byte counting pass-through reader with completion estimates.
 *
 * Wraps any Source, forwards reads unchanged and accumulates the number of bytes
 * successfully read. Fraction, average rate and ETA are derived from that counter,
 * the total size given at construction and the injected clock.
 */

#include "ProgressReader.hpp"
#include "utils/common.hpp"

ProgressReader::ProgressReader(std::unique_ptr<Source> source, size_t total_size, const Clock& clock)
    : m_source(std::move(source)), m_total_size(total_size), m_clock(&clock), m_start_time(clock.now())
{
    logger->debug("tracking progress of {} bytes", m_total_size);
}

ProgressReader ProgressReader::from_file(std::unique_ptr<FileSource> file, const Clock& clock) {
    if( !file ){
        throw std::invalid_argument("ProgressReader: no file");
    }
    size_t size = file->size();
    return ProgressReader(std::move(file), size, clock);
}

/**
 * @brief Opens a file and tracks reading it up to its current size.
 *
 * @param fname Path to file or block device.
 * @param clock Time source for elapsed time and ETA.
 * @throws std::runtime_error If the file cannot be opened or sized.
 */
ProgressReader ProgressReader::from_path(const std::filesystem::path& fname, const Clock& clock) {
    return from_file(std::make_unique<FileSource>(fname), clock);
}

/**
 * @brief Reads from the wrapped source and counts the result.
 *
 * Short reads and end of stream are returned as is. If the source throws,
 * the exception propagates and the counter stays unchanged.
 *
 * @return Whatever the wrapped source returned.
 * @throws std::logic_error If the source was released.
 */
size_t ProgressReader::read(void* buf, size_t count) {
    size_t nread = inner().read(buf, count);
    m_bytes_read += nread;
    return nread;
}

double ProgressReader::fraction() const {
    if( m_total_size == 0 ){
        return 1.0;
    }
    return static_cast<double>(m_bytes_read) / static_cast<double>(m_total_size);
}

Clock::duration ProgressReader::elapsed() const {
    return m_clock->now() - m_start_time;
}

double ProgressReader::rate() const {
    double seconds = std::chrono::duration<double>(elapsed()).count();
    if( m_bytes_read == 0 || seconds <= 0 ){
        return 0;
    }
    return m_bytes_read / seconds;
}

/**
 * @brief Estimates the time left: remaining bytes divided by average rate.
 *
 * Zero once the total size is reached (immediately for an empty source).
 * Unknown while nothing was read or the clock has not advanced since construction.
 * Saturates at Clock::duration::max() (~292 years) instead of overflowing.
 *
 * @param now Current time of the reader's clock.
 */
std::optional<Clock::duration> ProgressReader::eta_at(Clock::time_point now) const {
    if( m_bytes_read >= m_total_size ){
        return Clock::duration::zero();
    }

    Clock::duration dt = now - m_start_time;
    if( m_bytes_read == 0 || dt <= Clock::duration::zero() ){
        return std::nullopt;
    }

    // elapsed * remaining / done, in floating point to avoid overflow on large sizes
    double remaining = static_cast<double>(m_total_size - m_bytes_read);
    std::chrono::duration<double, Clock::duration::period> left = dt;
    left *= remaining / static_cast<double>(m_bytes_read);
    if( left.count() >= static_cast<double>(Clock::duration::max().count()) ){
        return Clock::duration::max();
    }
    return std::chrono::duration_cast<Clock::duration>(left);
}

std::optional<Clock::duration> ProgressReader::eta() const {
    return eta_at(m_clock->now());
}

std::optional<Clock::time_point> ProgressReader::est_total_time() const {
    Clock::time_point now = m_clock->now();
    std::optional<Clock::duration> left = eta_at(now);
    if( !left ){
        return std::nullopt;
    }
    if( *left > Clock::time_point::max() - now ){
        return Clock::time_point::max();
    }
    return now + *left;
}

Source& ProgressReader::inner() const {
    if( !m_source ){
        throw std::logic_error("ProgressReader: source was released");
    }
    return *m_source;
}

std::unique_ptr<Source> ProgressReader::release() {
    logger->debug("releasing source after {}/{} bytes", m_bytes_read, m_total_size);
    return std::move(m_source);
}
