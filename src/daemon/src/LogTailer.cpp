/*
 * Valheim Server Manager — Log tailer (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/LogTailer.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vsm {

LogTailer::LogTailer(Scheduler& sched, std::string path, EventParser parser,
                     Scheduler::Duration pollInterval)
: sched_(sched),
  path_(std::move(path)),
  parser_(std::move(parser)),
  interval_(pollInterval) {}

LogTailer::~LogTailer() {
    stop();
}

void LogTailer::start(bool fromEnd) {
    if (running_) return;

    running_ = true;
    offset_  = 0;
    partial_.clear();

    if (open_()) {
        if (fromEnd) {
            struct stat st{};
            if (::fstat(fd_, &st) == 0) offset_ = static_cast<std::uint64_t>(st.st_size);
        }
        LOG_DEBUG("tail: start %s at offset %llu", path_.c_str(),
                  static_cast<unsigned long long>(offset_));
    } else {
        LOG_DEBUG("tail: %s does not exist yet, waiting for it", path_.c_str());
    }

    task_ = sched_.runEvery(interval_, [this] { poll(); });
}

void LogTailer::stop() {
    if (task_ != Scheduler::kInvalidTask) {
        sched_.cancel(task_);
        task_ = Scheduler::kInvalidTask;
    }
    close_();
    if (running_) LOG_DEBUG("tail: stop %s", path_.c_str());
    running_ = false;
    partial_.clear();
}

void LogTailer::setPath(const std::string& path) {
    if (path == path_) return;
    const bool wasRunning = running_;
    stop();
    path_ = path;
    offset_ = 0;
    if (wasRunning) start(true);
}

TailCursor LogTailer::cursor() const {
    TailCursor c;
    c.filePath   = path_;
    c.byteOffset = offset_;
    c.running    = running_;
    return c;
}

bool LogTailer::open_() {
    if (fd_ >= 0) return true;
    const int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    fd_  = fd;
    dev_ = st.st_dev;
    ino_ = st.st_ino;
    return true;
}

void LogTailer::close_() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

/* The path now names another file, or nothing at all. */
bool LogTailer::rotated_() const {
    struct stat st{};
    if (::stat(path_.c_str(), &st) != 0) return true;
    return st.st_dev != dev_ || st.st_ino != ino_;
}

void LogTailer::poll() {
    if (!running_) return;

    if (fd_ < 0) {
        if (!open_()) return;
        struct stat st{};
        if (::fstat(fd_, &st) == 0 && offset_ > static_cast<std::uint64_t>(st.st_size)) {
            offset_ = 0;
            partial_.clear();
        }
    } else if (rotated_()) {
        LOG_DEBUG("tail: %s rotated or removed, reopening", path_.c_str());
        close_();
        offset_ = 0;
        partial_.clear();
        if (!open_()) return;
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        LOG_DEBUG("tail: fstat %s failed: %s", path_.c_str(), std::strerror(errno));
        close_();
        return;
    }

    const auto size = static_cast<std::uint64_t>(st.st_size);
    if (size < offset_) {
        LOG_DEBUG("tail: %s truncated (%llu < %llu), rewinding", path_.c_str(),
                  static_cast<unsigned long long>(size),
                  static_cast<unsigned long long>(offset_));
        offset_ = 0;
        partial_.clear();
        return;
    }
    if (size == offset_) return;

    std::vector<char> buf(kReadChunkBytes);
    while (offset_ < size && running_) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), size - offset_));
        const ssize_t n = ::pread(fd_, buf.data(), want, static_cast<off_t>(offset_));
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG("tail: read %s failed: %s", path_.c_str(), std::strerror(errno));
            close_();
            return;
        }
        if (n == 0) break;
        offset_ += static_cast<std::uint64_t>(n);
        consume_(buf.data(), static_cast<size_t>(n));
    }
}

void LogTailer::consume_(const char* data, size_t len) {
    partial_.append(data, len);

    size_t start = 0;
    for (;;) {
        const size_t nl = partial_.find('\n', start);
        if (nl == std::string::npos) break;
        const std::string line = util::trim(std::string_view(partial_).substr(start, nl - start));
        start = nl + 1;
        if (line.empty()) continue;

        onLine_.emit(line);
        if (parser_) {
            if (auto ev = parser_(line)) onEvent_.emit(*ev);
        }
        // A subscriber may have stopped us; drop what is left.
        if (!running_) {
            partial_.clear();
            return;
        }
    }
    partial_.erase(0, start);
}

std::vector<std::string> LogTailer::readLastLines(size_t n) const {
    return readLastLines(path_, n);
}

std::vector<std::string> LogTailer::readLastLines(const std::string& path, size_t n) {
    std::vector<std::string> out;
    if (n == 0) return out;

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return out;

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        ::close(fd);
        return out;
    }

    const auto fileSize = static_cast<std::uint64_t>(st.st_size);
    std::uint64_t pos = fileSize;
    std::string content;
    std::vector<char> buf(kReadChunkBytes);

    // Walk backwards until enough newlines were seen (n lines need n+1
    // separators unless we reach the start of the file).
    while (pos > 0) {
        const size_t chunk = static_cast<size_t>(std::min<std::uint64_t>(kReadChunkBytes, pos));
        pos -= chunk;
        size_t got = 0;
        while (got < chunk) {
            const ssize_t r = ::pread(fd, buf.data() + got, chunk - got, static_cast<off_t>(pos + got));
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) break;
            got += static_cast<size_t>(r);
        }
        if (got < chunk) {
            LOG_DEBUG("tail: short read on %s", path.c_str());
            break;
        }
        content.insert(0, buf.data(), chunk);
        if (util::nonEmptyLines(content).size() > n) break;
    }
    ::close(fd);

    auto lines = util::nonEmptyLines(content);
    if (lines.size() > n) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(n));
    }
    return lines;
}

} // namespace vsm
