#pragma once

#include <cstdint>
#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <chainsym/Errors.hpp>

namespace chainsym {

/*
 * Up to 7 uppercase letters packed into a uint64_t, one ASCII byte per
 *  character, first character in the least significant byte. Unused bytes
 *  are zero. This is the layout used on the wire and in chain state, so
 *  the ordering is the numeric ordering of the raw value, not the
 *  lexicographic ordering of the ticker.
 */
struct SymbolCode {
    constexpr static uint32_t max_length = 7;
    constexpr static uint32_t bits_per_char = 8;

    constexpr SymbolCode() noexcept = default;

    // Raw values come from decoded chain data and are accepted as-is.
    //  Use is_valid() before relying on them.
    explicit constexpr SymbolCode(const uint64_t raw) noexcept : _value(raw) { }

    explicit constexpr SymbolCode(const std::string_view str) : _value(encode(str)) { }

    constexpr static SymbolCode origin() noexcept { return SymbolCode{ }; }
    constexpr static SymbolCode from_raw(const uint64_t raw) noexcept { return SymbolCode{ raw }; }

    [[nodiscard]] constexpr static std::optional<ParseError> validate(const std::string_view str) noexcept {
        if (str.size() > max_length) return ParseError::TooLong;
        for (const char c : str) {
            if (!is_symbol_char(c)) return ParseError::InvalidCharacter;
        }
        return std::nullopt;
    }

    [[nodiscard]] constexpr uint64_t raw() const noexcept { return _value; }

    // Stops at the first zero byte. Anything above a gap is not counted.
    [[nodiscard]] constexpr uint32_t length() const noexcept {
        uint64_t sym = _value;
        uint32_t len = 0;
        while (sym & 0xFF) {
            ++len;
            sym >>= bits_per_char;
        }
        return len;
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        const auto len = length();
        if (len == 0 || len > max_length) return false;

        // No non-zero byte may follow the first zero byte
        if ((_value >> (bits_per_char * len)) != 0) return false;

        for (uint32_t i = 0; i < len; ++i) {
            if (!is_symbol_char(char_at(i))) return false;
        }
        return true;
    }

    [[nodiscard]] std::string to_string() const;

    constexpr explicit operator bool() const noexcept { return is_valid(); }

    constexpr auto operator<=>(const SymbolCode &) const noexcept = default;

private:

    constexpr static bool is_symbol_char(const char c) noexcept { return c >= 'A' && c <= 'Z'; }

    [[nodiscard]] constexpr char char_at(const uint32_t index) const noexcept {
        return static_cast<char>((_value >> (bits_per_char * index)) & 0xFF);
    }

    constexpr static uint64_t encode(const std::string_view str) {
        check(str.size() <= max_length, ParseError::TooLong);

        uint64_t raw = 0;
        for (uint32_t i = 0; i < str.size(); ++i) {
            check(is_symbol_char(str[i]), ParseError::InvalidCharacter);
            raw |= static_cast<uint64_t>(static_cast<uint8_t>(str[i])) << (bits_per_char * i);
        }
        return raw;
    }

    uint64_t _value = 0;
};

std::ostream& operator<<(std::ostream& s, SymbolCode code);

}

namespace std {
    template <>
    struct hash<chainsym::SymbolCode> {
        size_t operator()(const chainsym::SymbolCode& code) const noexcept {
            return std::hash<uint64_t>{}(code.raw());
        }
    };
}
