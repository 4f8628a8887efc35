#ifndef DIR_WC_MAPPED_CHUNKS_HPP
#define DIR_WC_MAPPED_CHUNKS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <cppcoro/generator.hpp>

constexpr auto operator ""_u64(unsigned long long int x) -> uint64_t {
    return x;
}

inline constexpr std::size_t defaultChunkSize = 1_u64 << 20;

// Read-only descriptor of a regular file, closed on destruction.
class FileHandle final {
public:
    explicit FileHandle(std::filesystem::path path);
    ~FileHandle();

    FileHandle(FileHandle const &) = delete;
    auto operator=(FileHandle const &) -> FileHandle & = delete;
    FileHandle(FileHandle &&other) noexcept;
    auto operator=(FileHandle &&other) noexcept -> FileHandle &;

    auto native() const -> int { return fd_; }
    auto size() const -> std::size_t { return size_; }
    auto path() const -> std::filesystem::path const & { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    std::size_t size_ = 0;
};

// Yields the file in consecutive windows of at most chunkSize bytes. Only the
// window currently handed out is mapped; it is unmapped when the consumer
// advances. The file must outlive the generator.
auto mappedChunks(FileHandle const &file, std::size_t chunkSize = defaultChunkSize)
    -> cppcoro::generator<std::string_view>;

#endif //DIR_WC_MAPPED_CHUNKS_HPP
