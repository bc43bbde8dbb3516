#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>

// Consumer of a response body, fed chunk by chunk by an HttpClient.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Called once before the first chunk. expected_size is -1 when unknown.
    virtual void start([[maybe_unused]] std::int64_t expected_size) {}
    virtual void write(const char* data, std::size_t size) = 0;
    // Called once after the last chunk of a successful transfer.
    virtual void finish() {}
};

// Writes the body to a file, truncating whatever was there.
class FileSink : public ByteSink {
public:
    explicit FileSink(const std::filesystem::path& path);

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const char* data, std::size_t size) override;
    // Flushes and closes; throws FilesystemError if buffered data cannot be written.
    void finish() override;

private:
    std::filesystem::path path_;
    std::ofstream out_;
};
