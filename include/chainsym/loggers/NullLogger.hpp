#pragma once

namespace chainsym::loggers {

class NullLogger {
public:
    template <typename T>
    void log(T&&) const noexcept { }
};

}
