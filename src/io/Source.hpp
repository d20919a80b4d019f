#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

#include "core/buf_t.hpp"

// anything bytes can be read from, sequentially
//
// read() returns the number of bytes placed into buf, which may be less than requested.
// 0 means end of stream (or count == 0). Errors are thrown, never returned.
class Source {
    public:
    virtual ~Source() = default;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    virtual size_t read(void* buf, size_t count) = 0;

    size_t read(buf_t& buf) {
        return read(buf.data(), buf.size());
    }
};
