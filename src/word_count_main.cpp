#include <iostream>

#include "word_count.hpp"

// Mount points provided by the job's hosting environment.
constexpr auto INPUT_DIR = "/inputs";
constexpr auto OUTPUT_DIR = "/outputs";

int main() {
    return runJob(INPUT_DIR, OUTPUT_DIR, std::cout, std::cerr);
}
