#pragma once

#include <string>

namespace chainsym::concepts {

template <typename LoggerType>
concept Logger = requires(const LoggerType& logger, std::string message) {
    logger.log(message);
};

}
