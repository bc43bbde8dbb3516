#include "sink.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <cerrno>
#include <cstring>

FileSink::FileSink(const std::filesystem::path& path)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_) {
        throw FilesystemError(string_format("error.create_file_failed", path_.string()) + ": " + std::strerror(errno));
    }
}

void FileSink::write(const char* data, std::size_t size) {
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        throw FilesystemError(string_format("error.write_file_failed", path_.string()));
    }
}

void FileSink::finish() {
    if (!out_.is_open()) {
        return;
    }
    out_.close();
    if (!out_) {
        throw FilesystemError(string_format("error.write_file_failed", path_.string()));
    }
}
