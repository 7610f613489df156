// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: body.cpp
//  描述: Body类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/body.hpp"
#include "protocol/protocol_types.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sync_http_client {
namespace protocol {

namespace {

// 文件描述符守卫，作用域结束时关闭
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " '" + path + "': " + strerror(errno);
}

} // namespace

const char* body_kind_to_string(BodyKind kind) {
    switch (kind) {
        case BodyKind::EMPTY: return "EMPTY";
        case BodyKind::BYTES: return "BYTES";
        case BodyKind::FILE_BACKED: return "FILE_BACKED";
        default: return "UNKNOWN";
    }
}

Body::Body()
    : kind_(BodyKind::EMPTY)
    , bytes_()
    , path_()
    , file_length_(0)
    , file_length_known_(false)
{
}

Body Body::empty() {
    return Body();
}

Body Body::from_bytes(std::vector<uint8_t> bytes) {
    Body body;
    body.kind_ = BodyKind::BYTES;
    body.bytes_ = std::move(bytes);
    return body;
}

Body Body::from_bytes(const uint8_t* data, size_t len) {
    return from_bytes(std::vector<uint8_t>(data, data + len));
}

Body Body::from_string(const std::string& text) {
    return from_bytes(std::vector<uint8_t>(text.begin(), text.end()));
}

utils::Result<Body> Body::from_file(const std::string& path) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return utils::make_err<Body>(utils::ErrorCode::IO_ERROR,
                                     errno_message("Cannot open", path));
    }

    struct stat st;
    if (::fstat(fd.get(), &st) != 0) {
        return utils::make_err<Body>(utils::ErrorCode::IO_ERROR,
                                     errno_message("Cannot stat", path));
    }
    if (S_ISDIR(st.st_mode)) {
        return utils::make_err<Body>(utils::ErrorCode::IO_ERROR,
                                     "Is a directory '" + path + "'");
    }

    Body body;
    body.kind_ = BodyKind::FILE_BACKED;
    body.path_ = path;
    if (S_ISREG(st.st_mode)) {
        body.file_length_ = static_cast<uint64_t>(st.st_size);
        body.file_length_known_ = true;
    }
    return utils::make_ok(std::move(body));
}

bool Body::known_length(uint64_t* length) const {
    uint64_t n = 0;
    switch (kind_) {
        case BodyKind::EMPTY:
            n = 0;
            break;
        case BodyKind::BYTES:
            n = bytes_.size();
            break;
        case BodyKind::FILE_BACKED:
            if (!file_length_known_) {
                return false;
            }
            n = file_length_;
            break;
        default:
            return false;
    }
    if (length) {
        *length = n;
    }
    return true;
}

utils::Result<void> Body::write_to(ByteSink& sink) const {
    switch (kind_) {
        case BodyKind::EMPTY:
            return utils::make_ok();
        case BodyKind::BYTES:
            if (bytes_.empty()) {
                return utils::make_ok();
            }
            return sink.write(bytes_.data(), bytes_.size());
        case BodyKind::FILE_BACKED:
            return write_file_to(sink);
        default:
            return utils::make_err(utils::ErrorCode::INVALID_ARGUMENT, "Unknown body kind");
    }
}

utils::Result<void> Body::write_file_to(ByteSink& sink) const {
    FileDescriptor fd(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return utils::make_err(utils::ErrorCode::IO_ERROR, errno_message("Cannot open", path_));
    }

    std::vector<uint8_t> chunk(BODY_CHUNK_SIZE);
    uint64_t sent = 0;
    while (!file_length_known_ || sent < file_length_) {
        size_t want = chunk.size();
        if (file_length_known_ && file_length_ - sent < want) {
            want = static_cast<size_t>(file_length_ - sent);
        }

        ssize_t n = ::read(fd.get(), chunk.data(), want);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return utils::make_err(utils::ErrorCode::IO_ERROR, errno_message("Read failed", path_));
        }
        if (n == 0) {
            if (file_length_known_) {
                // 发送的Content-Length已无法兑现
                return utils::make_err(utils::ErrorCode::IO_ERROR,
                                       "File '" + path_ + "' shrank: expected " +
                                       std::to_string(file_length_) + " bytes, read " +
                                       std::to_string(sent));
            }
            break;
        }

        utils::Result<void> ret = sink.write(chunk.data(), static_cast<size_t>(n));
        if (ret.is_err()) {
            return ret;
        }
        sent += static_cast<uint64_t>(n);
    }
    return utils::make_ok();
}

std::string Body::text() const {
    return std::string(bytes_.begin(), bytes_.end());
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
