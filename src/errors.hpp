#ifndef DIR_WC_ERRORS_HPP
#define DIR_WC_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

// A path could not be opened, read, mapped or created.
struct FilesystemError : std::filesystem::filesystem_error {
    using std::filesystem::filesystem_error::filesystem_error;
};

// The input directory has no entries to count.
struct EmptyInputError : std::runtime_error {
    explicit EmptyInputError(std::filesystem::path dir)
            : std::runtime_error{"no files found in " + dir.string()}, dir_{std::move(dir)} {}

    auto dir() const -> std::filesystem::path const & { return dir_; }

private:
    std::filesystem::path dir_;
};

#endif //DIR_WC_ERRORS_HPP
