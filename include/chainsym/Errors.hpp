#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chainsym {

enum class ParseError : uint8_t {
    TooLong,           // More than SymbolCode::max_length characters
    InvalidCharacter,  // Anything outside 'A'..'Z'
};

constexpr std::string_view describe(const ParseError error) noexcept {
    switch (error) {
        case ParseError::TooLong:
            return "string is too long to be a valid symbol_code";
        case ParseError::InvalidCharacter:
            return "only uppercase letters allowed in symbol_code string";
    }
    return "unknown symbol_code error";
}

class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const ParseError error)
        : std::invalid_argument(std::string{ describe(error) }), _error(error) { }

    [[nodiscard]] ParseError error() const noexcept { return _error; }

private:
    ParseError _error;
};

constexpr void check(const bool predicate, const ParseError error) {
    if (!predicate) throw InvalidInput{ error };
}

}
