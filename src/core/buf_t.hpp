#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

// byte buffer handed to Source::read(); size() is the read request
class buf_t : public std::vector<uint8_t> {
    public:
    buf_t() = default;
    buf_t(size_t size) : std::vector<uint8_t>(size) {}
};
