#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include "../util/errors.hpp"

namespace gsynth {

// Append-only edge-list writer.
// - Creates missing parent directories, truncates the target, writes the header.
// - Lines are formatted into a memory buffer and written out in chunks.
// - A sink that is not close()d (exception, cancellation) flushes its whole
//   lines and renames the file to "<path>.partial"; the target path never
//   holds an incomplete graph.
class edge_sink {
public:
    static constexpr std::size_t default_buffer_bytes = std::size_t{1} << 20;  // 1 MiB

    edge_sink(const std::filesystem::path& path,
              std::string_view header,
              std::size_t buffer_bytes = default_buffer_bytes)
        : path_(path), buffer_bytes_(buffer_bytes)
    {
        namespace fs = std::filesystem;
        if (buffer_bytes_ == 0) throw invalid_parameter("edge_sink: buffer_bytes must be > 0");

        buf_.reserve(buffer_bytes_ + 64);
        buf_.append(header.data(), header.data() + header.size());
        buf_.push_back('\n');

        const fs::path parent = path_.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                throw io_error(fmt::format("cannot create directory {}: {}", parent.string(), ec.message()));
            }
        }

        out_.open(path_, std::ios::binary | std::ios::trunc);
        if (!out_) throw io_error("failed to open for write: " + path_.string());
        open_ = true;
    }

    edge_sink(const edge_sink&) = delete;
    edge_sink& operator=(const edge_sink&) = delete;

    ~edge_sink() {
        if (open_) abandon();
    }

    void write_edge(std::uint64_t src, std::uint64_t dst) {
        fmt::format_to(std::back_inserter(buf_), "{} {}\n", src, dst);
        ++edges_;
        if (buf_.size() >= buffer_bytes_) flush_buffer();
    }

    // Flushes and releases the file. The target path now holds a complete graph.
    // If the last write fails the file is set aside as "<path>.partial" and
    // io_error is thrown.
    void close() {
        if (!open_) return;
        if (out_) {
            out_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
            out_.flush();
            if (out_) {
                bytes_ += buf_.size();
                buf_.clear();
            }
        }
        out_.close();
        open_ = false;
        if (out_.fail()) {
            buf_.clear();
            const auto partial = set_aside();
            throw io_error(fmt::format("failed to close {}{}", path_.string(),
                                       partial.empty() ? "" : "; kept whole lines in " + partial.string()));
        }

        // a leftover from an earlier interrupted run is stale now
        std::filesystem::path stale = path_;
        stale += ".partial";
        std::error_code ec;
        std::filesystem::remove(stale, ec);
    }

    // Flushes what can be flushed, closes, and moves the file aside as
    // "<path>.partial". Returns the partial path (empty if it could not be kept).
    std::filesystem::path abandon() noexcept {
        if (!open_) return {};
        open_ = false;
        if (out_) {
            out_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
            out_.flush();
            if (out_) bytes_ += buf_.size();
        }
        buf_.clear();
        out_.close();
        return set_aside();
    }

    bool is_open() const noexcept { return open_; }
    std::uint64_t edges_written() const noexcept { return edges_; }
    // Bytes flushed to the file so far (header included, pending buffer excluded).
    std::uintmax_t bytes_written() const noexcept { return bytes_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void flush_buffer() {
        if (buf_.size() == 0) return;
        out_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        out_.flush();
        if (!out_) throw io_error("write failed: " + path_.string());
        bytes_ += buf_.size();
        buf_.clear();
    }

    // bytes_ only ever advances by whole buffers, which end on a newline, so
    // cutting the file back to bytes_ drops any torn tail line.
    std::filesystem::path set_aside() noexcept {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (file_size_on_disk() != bytes_) fs::resize_file(path_, bytes_, ec);
        fs::path partial = path_;
        partial += ".partial";
        if (!ec) fs::rename(path_, partial, ec);
        if (ec) {
            fs::remove(path_, ec);
            return {};
        }
        return partial;
    }

    std::uintmax_t file_size_on_disk() const noexcept {
        std::error_code ec;
        const auto n = std::filesystem::file_size(path_, ec);
        return ec ? bytes_ : n;
    }

    std::filesystem::path path_;
    std::size_t buffer_bytes_;
    std::ofstream out_;
    fmt::memory_buffer buf_;
    std::uint64_t edges_ = 0;
    std::uintmax_t bytes_ = 0;
    bool open_ = false;
};

}
