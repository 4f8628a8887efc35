#ifndef DIR_WC_WORD_COUNT_HPP
#define DIR_WC_WORD_COUNT_HPP

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "mapped_chunks.hpp"

inline constexpr auto reportFileName = "count.txt";

// Names of the direct entries of dir, in the order the filesystem returns them.
auto listEntries(std::filesystem::path const &dir) -> std::vector<std::string>;

auto countFileWords(std::filesystem::path const &path, std::size_t chunkSize = defaultChunkSize) -> uint64_t;

/*
 * Counts the words of every entry of inputDir, writes one
 * "<name> has <N> words" line per entry to outputDir/count.txt and
 * "Total word count:  <N>" to console. Returns the total.
 *
 * Throws EmptyInputError when inputDir has no entries (no report is
 * created then) and FilesystemError on the first path that cannot be
 * opened, read or written.
 */
auto runWordCount(std::filesystem::path const &inputDir,
                  std::filesystem::path const &outputDir,
                  std::ostream &console) -> uint64_t;

// runWordCount for the job entry point: a failure becomes one line on
// diagnostics and exit status 1.
auto runJob(std::filesystem::path const &inputDir,
            std::filesystem::path const &outputDir,
            std::ostream &console,
            std::ostream &diagnostics) -> int;

#endif //DIR_WC_WORD_COUNT_HPP
