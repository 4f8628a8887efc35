#include "mapped_chunks.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <mio/mmap.hpp>

#include "errors.hpp"

namespace {

auto lastError() -> std::error_code {
    return {errno, std::generic_category()};
}

}

FileHandle::FileHandle(std::filesystem::path path) : path_{std::move(path)} {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ == -1) {
        throw FilesystemError("failed to open", path_, lastError());
    }

    struct stat sb{};
    if (::fstat(fd_, &sb) == -1) {
        auto const error = lastError();
        ::close(fd_);
        throw FilesystemError("failed to stat", path_, error);
    }
    if (!S_ISREG(sb.st_mode)) {
        ::close(fd_);
        throw FilesystemError("not a regular file", path_,
                              std::make_error_code(S_ISDIR(sb.st_mode) ? std::errc::is_a_directory
                                                                       : std::errc::invalid_argument));
    }
    size_ = static_cast<std::size_t>(sb.st_size);
}

FileHandle::~FileHandle() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle &&other) noexcept
        : path_{std::move(other.path_)}, fd_{std::exchange(other.fd_, -1)}, size_{std::exchange(other.size_, 0)} {}

auto FileHandle::operator=(FileHandle &&other) noexcept -> FileHandle & {
    if (this != &other) {
        if (fd_ != -1) {
            ::close(fd_);
        }
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

auto mappedChunks(FileHandle const &file, std::size_t chunkSize) -> cppcoro::generator<std::string_view> {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    auto const fileSize = file.size();
    for (std::size_t offset = 0; offset < fileSize; offset += chunkSize) {
        auto const length = std::min(chunkSize, fileSize - offset);

        std::error_code error;
        auto const chunk = mio::make_mmap_source(file.native(), offset, length, error);
        if (error) {
            throw FilesystemError("failed to map", file.path(), error);
        }

        co_yield std::string_view{chunk.data(), chunk.size()};
    }
}
