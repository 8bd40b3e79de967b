#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include "codec/errors.hpp"

namespace Cli {

enum class FlagParse {
    NotThisFlag,
    Ok,
    Invalid
};

// --name=N for a 32-bit signed N; out is untouched unless Ok
inline FlagParse parse_int_flag(const std::string& flag, const std::string& prefix, int32_t& out) {
    if (flag.compare(0, prefix.size(), prefix) != 0) return FlagParse::NotThisFlag;
    const std::string value = flag.substr(prefix.size());
    if (value.empty()) return FlagParse::Invalid;

    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(value.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return FlagParse::Invalid;
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        return FlagParse::Invalid;
    }
    out = static_cast<int32_t>(v);
    return FlagParse::Ok;
}

// Subcommand boundary: any exception becomes a message on err and exit code 1.
template <typename Fn>
int run_guarded(const std::string& context, Fn&& body, std::ostream& err = std::cerr) {
    try {
        return body();
    } catch (const LPV::Error& e) {
        err << context << ": " << e.what() << "\n";
    } catch (const std::exception& e) {
        err << context << ": unexpected failure: " << e.what() << "\n";
    }
    return 1;
}

} // namespace Cli
