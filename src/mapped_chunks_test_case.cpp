#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include "errors.hpp"
#include "flux.hpp"
#include "mapped_chunks.hpp"

namespace fs = std::filesystem;

static auto writeFile(fs::path const &path, std::string_view content) -> void {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

int main() {
    auto const dir = fs::temp_directory_path() / "dir_wc_mapped_chunks_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    // 2ページ以上にまたがる内容を小さなチャンクで読む。
    std::string text;
    for (auto i = 0; i < 2000; ++i) {
        text += "word" + std::to_string(i) + (i % 7 == 0 ? "\n" : " ");
    }
    writeFile(dir / "text.txt", text);

    std::size_t const chunkSizes[] = {1, 3, 4096, 5000, defaultChunkSize};
    for (auto chunkSize : chunkSizes) {
        FileHandle file{dir / "text.txt"};
        assert(file.size() == text.size());

        std::string joined;
        Flux result;
        for (auto chunk : mappedChunks(file, chunkSize)) {
            assert(!chunk.empty());
            assert(chunk.size() <= chunkSize);
            joined += chunk;
            result = result + countWords(chunk);
        }
        assert(joined == text);
        assert(result.words() == 2000);
    }

    // 空ファイルはチャンクなし。
    writeFile(dir / "empty.txt", "");
    {
        FileHandle file{dir / "empty.txt"};
        auto chunks = 0;
        for (auto chunk : mappedChunks(file)) {
            (void) chunk;
            ++chunks;
        }
        assert(chunks == 0);
    }

    // 存在しないファイル。
    {
        auto threw = false;
        try {
            FileHandle file{dir / "missing.txt"};
        } catch (FilesystemError const &e) {
            threw = true;
            assert(e.code() == std::errc::no_such_file_or_directory);
            assert(e.path1() == dir / "missing.txt");
        }
        assert(threw);
    }

    // ディレクトリは読めない。
    {
        fs::create_directories(dir / "sub");
        auto threw = false;
        try {
            FileHandle file{dir / "sub"};
        } catch (FilesystemError const &e) {
            threw = true;
            assert(e.code() == std::errc::is_a_directory);
        }
        assert(threw);
    }

    // ムーブ後も読める。
    {
        FileHandle first{dir / "text.txt"};
        FileHandle second{std::move(first)};
        assert(first.native() == -1);
        assert(second.size() == text.size());
        std::string joined;
        for (auto chunk : mappedChunks(second, 4096)) {
            joined += chunk;
        }
        assert(joined == text);
    }

    fs::remove_all(dir);
}
