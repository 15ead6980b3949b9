#include <iostream>
#include <string_view>
#include <vector>

#include <chainsym/Parsing.hpp>
#include <chainsym/SymbolCode.hpp>
#include <chainsym/loggers/StreamLogger.hpp>

void describe_code(const chainsym::SymbolCode code) {
    std::cout << code
              << "\traw = " << code.raw()
              << "\tlength = " << code.length()
              << "\tvalid = " << (code.is_valid() ? "true" : "false") << '\n';
}

int main(int argc, char** argv) {
    using namespace chainsym;

    std::vector<std::string_view> tickers(argv + 1, argv + argc);
    if (tickers.empty()) {
        tickers = { "EOS", "FOO" };
    }

    loggers::StdErrLogger logger;
    int status = 0;
    for (const auto ticker : tickers) {
        if (const auto code = try_parse(ticker, logger)) {
            describe_code(*code);
        } else {
            status = 1;
        }
    }
    return status;
}
