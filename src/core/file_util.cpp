#include "taildrive/core/file_util.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>

namespace taildrive {

namespace fs = std::filesystem;

namespace {

std::string temp_suffix() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    return ".tmp" + std::to_string(generator() % 1000000);
}

Result<void> write_bytes(const fs::path& path, const char* data, std::size_t size) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err("Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = path;
    temp += temp_suffix();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err("Cannot open " + temp.string() + " for writing");
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return Err("Short write to " + temp.string());
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err("Cannot move file into place at " + path.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace

uint64_t unix_now() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

Result<uint64_t> file_mtime(const fs::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return Err("Cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    if (!S_ISREG(info.st_mode)) {
        return Err(path.string() + " is not a regular file");
    }
    return Ok(static_cast<uint64_t>(info.st_mtime));
}

Result<uint64_t> path_mtime(const fs::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return Err("Cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    return Ok(static_cast<uint64_t>(info.st_mtime));
}

Result<void> set_file_mtime(const fs::path& path, uint64_t seconds) {
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(seconds);
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        return Err("Cannot set mtime of " + path.string() + ": " + std::strerror(errno));
    }
    return Ok();
}

Result<std::vector<uint8_t>> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err("Cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Err("Read error on " + path.string());
    }
    return Ok(std::move(data));
}

Result<void> write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    return write_bytes(path, reinterpret_cast<const char*>(data.data()), data.size());
}

Result<void> write_file(const fs::path& path, const std::string& data) {
    return write_bytes(path, data.data(), data.size());
}

} // namespace taildrive
