#undef NDEBUG
#include <cassert>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include "word_count.hpp"

namespace fs = std::filesystem;

// Fresh inputs/ and outputs/ under the temp directory, removed on destruction.
struct JobDirs {
    fs::path root;
    fs::path inputs;
    fs::path outputs;

    explicit JobDirs(std::string const &name)
            : root{fs::temp_directory_path() / ("dir_wc_" + name)},
              inputs{root / "inputs"},
              outputs{root / "outputs"} {
        fs::remove_all(root);
        fs::create_directories(inputs);
        fs::create_directories(outputs);
    }

    ~JobDirs() {
        std::error_code ignored;
        fs::remove_all(root, ignored);
    }

    auto write(std::string const &name, std::string_view content) const -> void {
        std::ofstream out(inputs / name, std::ios::binary);
        out << content;
    }

    auto report() const -> fs::path { return outputs / reportFileName; }

    // Report lines sorted, since enumeration order is up to the filesystem.
    auto reportLines() const -> std::vector<std::string> {
        std::ifstream in(report());
        std::vector<std::string> lines;
        for (std::string line; std::getline(in, line);) {
            lines.push_back(line);
        }
        std::sort(lines.begin(), lines.end());
        return lines;
    }
};

static auto twoFiles() -> void {
    JobDirs dirs{"two_files"};
    dirs.write("file1.txt", "the quick fox");
    dirs.write("file2.txt", "a\nb\tc  d");

    std::ostringstream console;
    auto const total = runWordCount(dirs.inputs, dirs.outputs, console);

    assert(total == 7);
    assert(console.str() == "Total word count:  7\n");
    assert((dirs.reportLines() == std::vector<std::string>{"file1.txt has 3 words", "file2.txt has 4 words"}));

    // 同じ入力なら同じ結果。
    fs::remove(dirs.report());
    std::ostringstream again;
    assert(runWordCount(dirs.inputs, dirs.outputs, again) == 7);
    assert(again.str() == console.str());
    assert((dirs.reportLines() == std::vector<std::string>{"file1.txt has 3 words", "file2.txt has 4 words"}));
}

static auto emptyFile() -> void {
    JobDirs dirs{"empty_file"};
    dirs.write("empty.txt", "");

    std::ostringstream console;
    assert(runWordCount(dirs.inputs, dirs.outputs, console) == 0);
    assert(console.str() == "Total word count:  0\n");
    assert((dirs.reportLines() == std::vector<std::string>{"empty.txt has 0 words"}));
}

static auto whitespaceOnly() -> void {
    JobDirs dirs{"whitespace_only"};
    dirs.write("blank.txt", " \t\n\r\f\v  \n");
    dirs.write("words.txt", "  one two\nthree  ");

    std::ostringstream console;
    assert(runWordCount(dirs.inputs, dirs.outputs, console) == 3);
    assert((dirs.reportLines() == std::vector<std::string>{"blank.txt has 0 words", "words.txt has 3 words"}));
}

static auto largeFile() -> void {
    JobDirs dirs{"large_file"};
    std::string text;
    for (auto i = 0; i < 100000; ++i) {
        text += "lorem ipsum\n";
    }
    dirs.write("large.txt", text);

    assert(countFileWords(dirs.inputs / "large.txt", 4096) == 200000);
    assert(countFileWords(dirs.inputs / "large.txt", 4099) == 200000);

    std::ostringstream console;
    assert(runWordCount(dirs.inputs, dirs.outputs, console) == 200000);
    assert(console.str() == "Total word count:  200000\n");
}

static auto emptyInput() -> void {
    JobDirs dirs{"empty_input"};

    std::ostringstream console;
    auto threw = false;
    try {
        runWordCount(dirs.inputs, dirs.outputs, console);
    } catch (EmptyInputError const &e) {
        threw = true;
        assert(e.dir() == dirs.inputs);
    }
    assert(threw);
    assert(!fs::exists(dirs.report()));
    assert(console.str().empty());
}

static auto missingInput() -> void {
    JobDirs dirs{"missing_input"};

    std::ostringstream console;
    auto threw = false;
    try {
        runWordCount(dirs.root / "nowhere", dirs.outputs, console);
    } catch (FilesystemError const &e) {
        threw = true;
        assert(e.code() == std::errc::no_such_file_or_directory);
    }
    assert(threw);
    assert(!fs::exists(dirs.report()));
    assert(console.str().empty());
}

static auto missingOutput() -> void {
    JobDirs dirs{"missing_output"};
    dirs.write("file1.txt", "one two");

    std::ostringstream console;
    auto threw = false;
    try {
        runWordCount(dirs.inputs, dirs.root / "nowhere", console);
    } catch (FilesystemError const &e) {
        threw = true;
        assert(e.path1() == dirs.root / "nowhere" / reportFileName);
        assert(e.code().value() != 0);
    }
    assert(threw);
    assert(console.str().empty());
}

static auto subdirectoryEntry() -> void {
    JobDirs dirs{"subdirectory_entry"};
    dirs.write("file1.txt", "one two");
    fs::create_directories(dirs.inputs / "nested");

    std::ostringstream console;
    auto threw = false;
    try {
        runWordCount(dirs.inputs, dirs.outputs, console);
    } catch (FilesystemError const &e) {
        threw = true;
        assert(e.code() == std::errc::is_a_directory);
    }
    assert(threw);
    assert(console.str().empty());
}

static auto lineCount(std::string const &text) -> long {
    return std::count(text.begin(), text.end(), '\n');
}

static auto jobExitStatus() -> void {
    {
        JobDirs dirs{"job_two_files"};
        dirs.write("file1.txt", "the quick fox");
        dirs.write("file2.txt", "a\nb\tc  d");

        std::ostringstream console, diagnostics;
        assert(runJob(dirs.inputs, dirs.outputs, console, diagnostics) == 0);
        assert(console.str() == "Total word count:  7\n");
        assert(diagnostics.str().empty());
    }

    // 入力ディレクトリがない。
    {
        JobDirs dirs{"job_missing_input"};

        std::ostringstream console, diagnostics;
        assert(runJob(dirs.root / "nowhere", dirs.outputs, console, diagnostics) == 1);
        assert(console.str().empty());
        assert(lineCount(diagnostics.str()) == 1);
        assert(diagnostics.str().back() == '\n');
        assert(!fs::exists(dirs.report()));
    }

    // 入力ディレクトリが空。
    {
        JobDirs dirs{"job_empty_input"};

        std::ostringstream console, diagnostics;
        assert(runJob(dirs.inputs, dirs.outputs, console, diagnostics) == 1);
        assert(console.str().empty());
        assert(lineCount(diagnostics.str()) == 1);
        assert(diagnostics.str().find("no files found") != std::string::npos);
        assert(!fs::exists(dirs.report()));
    }
}

static auto entriesAreNames() -> void {
    JobDirs dirs{"entries_are_names"};
    dirs.write("a.txt", "x");
    dirs.write("b.txt", "y");

    auto names = listEntries(dirs.inputs);
    std::sort(names.begin(), names.end());
    assert((names == std::vector<std::string>{"a.txt", "b.txt"}));
}

int main() {
    twoFiles();
    emptyFile();
    whitespaceOnly();
    largeFile();
    emptyInput();
    missingInput();
    missingOutput();
    subdirectoryEntry();
    entriesAreNames();
    jobExitStatus();
}
