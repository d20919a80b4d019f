/**
 * @file FileSource.cpp
 * @brief Sequential file and block device source.
 *
 * Opens a regular file or a block device read-only, determines its size from
 * metadata and reads it front to back. Interrupted reads are retried; any other
 * read failure is reported as Source::ReadError.
 */

#include "FileSource.hpp"
#include "utils/common.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/ioctl.h>
#include <linux/fs.h>
#endif

#ifdef O_BINARY
#define OPEN_MODE O_RDONLY|O_BINARY
#else
#define OPEN_MODE O_RDONLY
#endif

/**
 * @brief Determines the size of an open regular file or block device.
 *
 * @param fd Open file descriptor.
 * @return Size in bytes.
 * @throws std::runtime_error If fstat/ioctl fails or fd is neither a regular file nor a block device.
 */
size_t FileSource::get_size(int fd) {
    struct stat st;
    if( fstat(fd, &st) == -1 ) {
        throw std::runtime_error(fmt::format("fstat({:#x}): {}", fd, strerror(errno)));
    }

    if( S_ISREG(st.st_mode) ) {
        return st.st_size;
    }

    if( S_ISBLK(st.st_mode) ) {
        uint64_t size = 0;
#ifdef __linux__
        if( ioctl(fd, BLKGETSIZE64, &size) == -1 ) {
            throw std::runtime_error(fmt::format("ioctl({:#x}, BLKGETSIZE64): {}", fd, strerror(errno)));
        }
#endif
        return size;
    }

    // pipes, sockets, ttys: no meaningful size
    throw std::runtime_error(fmt::format("fd {:#x}: not a regular file or block device (mode {:#o})", fd, st.st_mode));
}

/**
 * @brief Determines the size of a regular file or block device by path.
 *
 * @param fname Path to file or device.
 * @return Size in bytes.
 * @throws std::runtime_error If the path cannot be opened or sized.
 */
size_t FileSource::get_size(const std::filesystem::path& fname) {
    int fd = open(fname.string().c_str(), OPEN_MODE);
    if( fd == -1 ) {
        throw std::runtime_error(fmt::format("open(\"{}\"): {}", fname, strerror(errno)));
    }
    try {
        size_t size = get_size(fd);
        close(fd);
        return size;
    } catch( const std::runtime_error& ) {
        close(fd);
        throw;
    }
}

/**
 * @brief Opens the specified file or device and determines its size.
 *
 * @param fname Path to file or device to open.
 * @throws std::runtime_error If file cannot be opened or size cannot be determined.
 */
FileSource::FileSource(const std::filesystem::path& fname) : m_name(fname.string()) {
    m_fd = open(fname.string().c_str(), OPEN_MODE);
    if( m_fd == -1 ) {
        throw std::runtime_error(fmt::format("open(\"{}\", {:#x}): {}", fname, OPEN_MODE, strerror(errno)));
    }
    try {
        m_size = get_size(m_fd);
    } catch( const std::runtime_error& ) {
        close(m_fd);
        throw;
    }
    logger->debug("opened {}, size: {} ({})", m_name, m_size, bytes2human(m_size, " bytes"));
}

/**
 * @brief Adopts an already open descriptor.
 *
 * The descriptor is owned from here on: closed on destruction, or right away
 * if sizing fails.
 *
 * @param fd Open file descriptor.
 * @param name Display name for log and error messages.
 * @throws std::runtime_error If the size cannot be determined.
 */
FileSource::FileSource(int fd, const std::string& name) : m_name(name.empty() ? fmt::format("fd {}", fd) : name), m_fd(fd) {
    try {
        m_size = get_size(m_fd);
    } catch( const std::runtime_error& ) {
        close(m_fd);
        throw;
    }
    logger->debug("adopted {}, size: {} ({})", m_name, m_size, bytes2human(m_size, " bytes"));
}

FileSource::~FileSource() {
    if( m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Reads the next chunk from the current position.
 *
 * @param buf Buffer to read into.
 * @param count Maximum number of bytes to read.
 * @return Number of bytes actually read, 0 at end of file.
 * @throws ReadError On read error.
 */
size_t FileSource::read(void* buf, size_t count) {
    while(true) {
        ssize_t nread = ::read(m_fd, buf, count);
        if( nread == -1 ) {
            if( errno == EINTR ) continue; // Retry if interrupted
            throw ReadError(fmt::format("read({}, fd {:#x}, count {:#x}): {}", m_name, m_fd, count, strerror(errno)));
        }
        return static_cast<size_t>(nread);
    }
}
