#undef NDEBUG
#include <cassert>
#include <string_view>
#include "flux.hpp"

int main(){
    using namespace std::literals;

    auto text = "testing one two three"sv;
    auto result = countWords(text);
    assert(result.words() == 4);

    // 単語の途中で分割しても結果は同じ。
    auto sub1 = "testing on"sv, sub2 = "e two three"sv;
    assert(result == (countWords(sub1) + countWords(sub2)));

    // 空白の位置で分割しても同じ。
    auto sub3 = "testing one"sv, sub4 = " two three"sv;
    assert(result == (countWords(sub3) + countWords(sub4)));

    // Fluxモノイドはcommutativeではない。
    assert((countWords(sub3) + countWords(sub4)) != (countWords(sub4) + countWords(sub3)));

    // 単位元。
    assert(countWords(""sv) == Flux{});
    assert(countWords(""sv).words() == 0);
    assert((Flux{} + result) == result);
    assert((result + Flux{}) == result);

    assert(countWords(" \t\n\r\f\v"sv).words() == 0);
    assert(countWords("  leading and trailing  \n"sv).words() == 3);
    assert(countWords("a\nb\tc  d"sv).words() == 4);
    assert(countWords("the quick fox"sv).words() == 3);
    assert(countWords("#heading\n// comment"sv).words() == 3);

    // 非ASCIIのバイトは単語の一部。
    assert(countWords("caf\xc3\xa9 na\xc3\xafve"sv).words() == 2);
}
