#include "word_count.hpp"

#include <cerrno>
#include <exception>
#include <fstream>
#include <system_error>

#include "flux.hpp"

auto listEntries(std::filesystem::path const &dir) -> std::vector<std::string> {
    std::error_code error;
    auto it = std::filesystem::directory_iterator(dir, error);
    if (error) {
        throw FilesystemError("failed to open input directory", dir, error);
    }

    std::vector<std::string> names;
    for (; it != std::filesystem::directory_iterator{}; it.increment(error)) {
        names.push_back(it->path().filename().string());
    }
    if (error) {
        throw FilesystemError("failed to read input directory", dir, error);
    }
    return names;
}

auto countFileWords(std::filesystem::path const &path, std::size_t chunkSize) -> uint64_t {
    FileHandle file{path};

    Flux result;
    for (auto chunk : mappedChunks(file, chunkSize)) {
        result = result + countWords(chunk);
    }
    return result.words();
}

auto runWordCount(std::filesystem::path const &inputDir,
                  std::filesystem::path const &outputDir,
                  std::ostream &console) -> uint64_t {
    auto const entries = listEntries(inputDir);
    if (entries.empty()) {
        throw EmptyInputError(inputDir);
    }

    auto const reportPath = outputDir / reportFileName;
    errno = 0;
    std::ofstream report(reportPath, std::ios::out | std::ios::trunc);
    if (!report.is_open()) {
        auto const error = errno != 0 ? std::error_code{errno, std::generic_category()}
                                      : std::make_error_code(std::errc::io_error);
        throw FilesystemError("failed to create report", reportPath, error);
    }

    uint64_t total = 0;
    for (auto const &entry : entries) {
        auto const words = countFileWords(inputDir / entry);
        total += words;

        report << entry << " has " << words << " words\n";
        if (!report) {
            throw FilesystemError("failed to write report", reportPath, std::make_error_code(std::errc::io_error));
        }
    }

    report.close();
    if (report.fail()) {
        throw FilesystemError("failed to write report", reportPath, std::make_error_code(std::errc::io_error));
    }

    console << "Total word count:  " << total << std::endl;
    return total;
}

auto runJob(std::filesystem::path const &inputDir,
            std::filesystem::path const &outputDir,
            std::ostream &console,
            std::ostream &diagnostics) -> int {
    try {
        runWordCount(inputDir, outputDir, console);
    } catch (std::exception const &e) {
        diagnostics << e.what() << std::endl;
        return 1;
    }
    return 0;
}
