#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <chainsym/SymbolCode.hpp>
#include <chainsym/concepts/Logger.hpp>
#include <chainsym/loggers/NullLogger.hpp>

namespace chainsym {

// Same rules as the SymbolCode string constructor, without throwing.
//  A rejected input is reported to the logger as "<input>\t<reason>".
template <concepts::Logger LoggerType = loggers::NullLogger>
[[nodiscard]] std::optional<SymbolCode> try_parse(const std::string_view str, const LoggerType& logger = LoggerType{ }) {
    if (const auto error = SymbolCode::validate(str)) {
        std::string message { str };
        message += '\t';
        message += describe(*error);
        logger.log(message);
        return std::nullopt;
    }
    return SymbolCode{ str };
}

}
