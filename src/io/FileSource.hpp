#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "io/Source.hpp"

// sequential reader over:
//  - regular file
//  - linux block device (/dev/sdX)
//
// size() comes from metadata at open time and is not refreshed if the file grows.
class FileSource : public Source {
    public:
    explicit FileSource(const std::filesystem::path& fname);

    // takes ownership of an already open descriptor
    explicit FileSource(int fd, const std::string& name = "");
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    using Source::read;
    size_t read(void* buf, size_t count) override;

    // size of a regular file/device, as reported at open time
    size_t size() const { return m_size; }
    const std::string& name() const { return m_name; }

    // either succeeds or throws an exception
    static size_t get_size(const std::filesystem::path& fname);
    static size_t get_size(int fd);

    private:
        std::string m_name;
        int m_fd = -1;
        size_t m_size = 0;
};
