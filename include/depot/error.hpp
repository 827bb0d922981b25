#pragma once

#include <string>

namespace depot {

// Fatal error returned through Result<T>. Non-fatal diagnostics go to a
// log::Sink instead.
struct DepotError {
    enum Code {
        IO,          // filesystem access, copying into the destination
        Parse,       // malformed XML or TOML
        Config,      // unusable configuration, e.g. no SDK path for {{ sdk }}
        Dependency,  // no candidate, unresolvable conflict, non-convergence
        Manifest,    // well-formed POM with unusable content
        NotFound,    // missing dependency file or template variable
        InvalidArg   // bad caller input such as a client name
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    DepotError() = default;
    DepotError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DepotError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DepotError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace depot
