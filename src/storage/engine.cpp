/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file engine.cpp
 * @brief Implementation of the commit journal.
 *
 * @details
 * Frames are `[4-byte length][4-byte checksum][N-byte UTF-8 payload]`. The explicit
 * length keeps boundaries exact without delimiters; the checksum detects torn writes
 * left behind by a crash in the middle of an append.
 *
 * Appends go through a POSIX descriptor so that synchronous commits can be fsync()ed.
 * Compaction keeps the buffered stream path.
 */

#include "chronicle/storage/engine.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chronicle::storage {

namespace {

std::string encode_frame(const std::string& payload)
{
    std::uint32_t length = static_cast<std::uint32_t>(payload.size());
    std::uint32_t sum = Engine::checksum(payload);

    std::string frame;
    frame.reserve(sizeof(length) + sizeof(sum) + payload.size());
    frame.append(reinterpret_cast<const char*>(&length), sizeof(length));
    frame.append(reinterpret_cast<const char*>(&sum), sizeof(sum));
    frame.append(payload);
    return frame;
}

/// @brief Closes a POSIX descriptor on scope exit.
class FileHandle {
  public:
    explicit FileHandle(int fd) : fd_(fd) {}

    ~FileHandle()
    {
        if (fd_ >= 0)
            ::close(fd_);
    }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    int get() const
    {
        return fd_;
    }

  private:
    int fd_;
};

/// @brief Writes the whole buffer, resuming after short writes and EINTR.
bool write_all(int fd, const char* data, std::size_t size)
{
    while (size > 0) {
        ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

} // namespace

Engine::Engine(std::string base_path) : base_path_(std::move(base_path)) {}

void Engine::init()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }
}

std::string Engine::path() const
{
    return base_path_ + "/journal.aev";
}

std::uint32_t Engine::checksum(const std::string& payload)
{
    std::uint32_t hash = 2166136261u;
    for (unsigned char c : payload) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

/**
 * @brief Replays the journal frame by frame.
 *
 * 1. **Header Read:** length and checksum (8 bytes).
 * 2. **Body Read:** exactly `length` bytes.
 * 3. **Validation:** a short read or checksum mismatch ends the replay; every frame
 * after a damaged one is unreachable by construction.
 */
std::vector<std::string> Engine::load(bool& corrupt)
{
    corrupt = false;
    std::vector<std::string> frames;

    std::ifstream file(path(), std::ios::binary);
    if (!file.is_open()) {
        return frames;
    }

    std::uint64_t intact = 0;
    while (file.peek() != EOF) {
        std::uint32_t length = 0;
        std::uint32_t expected = 0;

        file.read(reinterpret_cast<char*>(&length), sizeof(length));
        file.read(reinterpret_cast<char*>(&expected), sizeof(expected));
        if (!file || length > kMaxFrameSize) {
            corrupt = true;
            break;
        }

        std::string buffer;
        buffer.resize(length);
        file.read(&buffer[0], length);
        if (file.gcount() != static_cast<std::streamsize>(length) ||
            checksum(buffer) != expected) {
            corrupt = true;
            break;
        }
        frames.push_back(std::move(buffer));
        intact += sizeof(length) + sizeof(expected) + length;
    }
    end_ = intact;
    return frames;
}

/**
 * @brief Appends one frame through a POSIX descriptor.
 *
 * 1. **Size Check:** payloads above `kMaxFrameSize` would be rejected as damage on
 * replay, so they are refused here instead.
 * 2. **Cut-back:** bytes past the last intact frame (left by an earlier failed append)
 * are truncated before writing.
 * 3. **Write:** the encoded frame is written in full; `sync` adds an fsync().
 * 4. **Rollback:** on any failure the file is truncated to where the frame began.
 */
bool Engine::append(const std::string& payload, bool sync)
{
    if (payload.size() > kMaxFrameSize) {
        return false;
    }

    FileHandle file(::open(path().c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (file.get() < 0) {
        return false;
    }

    struct stat info {};
    if (::fstat(file.get(), &info) != 0) {
        return false;
    }
    std::uint64_t size = static_cast<std::uint64_t>(info.st_size);
    std::uint64_t start = end_ && *end_ < size ? *end_ : size;
    if (start < size && ::ftruncate(file.get(), static_cast<off_t>(start)) != 0) {
        return false;
    }

    std::string frame = encode_frame(payload);
    bool ok = write_all(file.get(), frame.data(), frame.size());
    if (ok && sync) {
        ok = ::fsync(file.get()) == 0;
    }

    if (!ok) {
        if (::ftruncate(file.get(), static_cast<off_t>(start)) != 0) {
            // Pin the intact length so the next append redoes the cut-back.
            end_ = start;
        }
        return false;
    }

    end_ = start + frame.size();
    if (sync) {
        ++synced_frames_;
    }
    return true;
}

/**
 * @brief Rewrites the journal atomically.
 *
 * **Compaction Strategy:**
 * 1. **Snapshot:** Writes the supplied frames to `journal.aev.tmp`.
 * 2. **Flush:** Closes the temporary file and checks the stream state.
 * 3. **Atomic Swap:** `fs::rename` replaces the old journal, so at no point is the
 * data directory without a complete journal.
 */
bool Engine::compact(const std::vector<std::string>& frames)
{
    std::string temp_path = path() + ".tmp";

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    std::uint64_t total = 0;
    for (const auto& frame : frames) {
        std::string encoded = encode_frame(frame);
        file.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
        total += encoded.size();
    }

    file.flush();
    file.close();

    if (file.fail()) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return false;
    }

    std::error_code ec;
    fs::rename(temp_path, path(), ec);
    if (ec) {
        return false;
    }
    end_ = total;
    return true;
}

} // namespace chronicle::storage
