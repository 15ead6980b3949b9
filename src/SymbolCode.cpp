#include <chainsym/SymbolCode.hpp>

namespace chainsym {

std::string SymbolCode::to_string() const {
    const auto len = length();

    std::string result;
    result.reserve(len);
    for (uint32_t i = 0; i < len; ++i) {
        result.push_back(char_at(i));
    }
    return result;
}

std::ostream& operator<<(std::ostream& s, const SymbolCode code) {
    s << code.to_string();
    return s;
}

}
