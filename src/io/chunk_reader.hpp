#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <vector>

#include "../util/errors.hpp"

namespace gsynth {

class chunk_reader {
public:
    chunk_reader(const std::filesystem::path& p, std::size_t chunk_bytes)
        : path_(p), buf_(chunk_bytes)
    {
        if (chunk_bytes == 0) throw invalid_parameter("chunk_bytes == 0");
        in_.open(path_, std::ios::binary);
        if (!in_) throw io_error("Failed to open file: " + path_.string());
    }

    // Next chunk; empty at EOF. The view is valid until the following call.
    std::string_view next() {
        if (!in_) return {};
        in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        const auto got = static_cast<std::size_t>(in_.gcount());
        if (in_.bad()) throw io_error("Read failed: " + path_.string());
        bytes_read_ += got;
        return std::string_view(buf_.data(), got);
    }

    std::uint64_t bytes_read() const noexcept { return bytes_read_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::vector<char> buf_;
    std::uint64_t bytes_read_ = 0;
};

}
