#pragma once

#include <iostream>

namespace chainsym::loggers {

// StreamFunc is a default constructible functor returning the stream to write to.
//  Each message is written on its own line.
template <typename StreamFunc>
class StreamLogger {

    // This will be a reference type for functors that return references
    using Stream = decltype(StreamFunc{ }());

    Stream stream = StreamFunc{ }();

public:

    template <typename T>
    void log(const T& message) const noexcept {
        stream << message << '\n';
    }
};

struct StdOutFunc {
    std::ostream& operator()() const noexcept { return std::cout; }
};

struct StdErrFunc {
    std::ostream& operator()() const noexcept { return std::cerr; }
};

using StdOutLogger = StreamLogger<StdOutFunc>;
using StdErrLogger = StreamLogger<StdErrFunc>;

}
