#ifndef DIR_WC_FLUX_HPP
#define DIR_WC_FLUX_HPP

#include <variant>
#include <compare>
#include <cctype>
#include <cstdint>
#include <numeric>
#include <string_view>
#include <utility>

enum class CharType {
    IsSpace, NotSpace
};

template<class... Ts>
struct overloaded : Ts ... {
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Word count of a piece of text together with whether the piece starts and
// ends inside a word, so that two adjacent pieces can be combined exactly.
// Associative but not commutative.
struct Flux final {
    struct Flux_ {
        uint64_t count;
        CharType leftMost;
        CharType rightMost;
        auto operator<=>(Flux_ const&) const = default;
    };

    struct Unknown_ {
        auto operator<=>(Unknown_ const&) const = default;
    };

    std::variant<Flux_, Unknown_> data;
    auto operator<=>(Flux const&) const = default;

    Flux() : data{Unknown_{}} {} // empty
    Flux(Flux_ f) : data{std::move(f)} {}

    friend auto operator+(Flux const &lhs, Flux const &rhs) -> Flux {
        return std::visit(overloaded{
                                  [](Unknown_, Unknown_) -> Flux {
                                      return {};
                                  },
                                  [](Unknown_, Flux_ y) -> Flux {
                                      return y;
                                  },
                                  [](Flux_ x, Unknown_) -> Flux {
                                      return x;
                                  },
                                  [](Flux_ l, Flux_ r) -> Flux {
                                      auto count = l.rightMost == CharType::NotSpace && r.leftMost == CharType::NotSpace ?
                                                   (l.count + r.count - 1) : (l.count + r.count);
                                      return Flux{Flux_{.count = count, .leftMost = l.leftMost, .rightMost = r.rightMost}};
                                  }
                          },
                          lhs.data, rhs.data);
    }

    template<typename... F>
    decltype(auto) match(F... fs) const {
        return std::visit(overloaded{fs...}, data);
    }

    auto words() const -> uint64_t {
        return match(
                [](Flux_ f) -> uint64_t { return f.count; },
                [](Unknown_) -> uint64_t { return 0; });
    }
};

// Space, \t, \n, \v, \f and \r separate words.
inline auto flux(char c) -> Flux {
    return std::isspace(static_cast<unsigned char>(c)) != 0 ?
           Flux::Flux_{.count = 0, .leftMost = CharType::IsSpace, .rightMost = CharType::IsSpace} :
           Flux::Flux_{.count = 1, .leftMost = CharType::NotSpace, .rightMost = CharType::NotSpace};
}

inline auto countWords(std::string_view text) -> Flux {
    return std::accumulate(text.begin(), text.end(), Flux{}, [](Flux f, char c) { return f + flux(c); });
}

#endif //DIR_WC_FLUX_HPP
