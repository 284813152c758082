#pragma once
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace parley {

// Dynamic answer value. Scalars for string/number/boolean answers,
// sequences for gathered answers and shell selections.
using Answer = YAML::Node;

#if defined(_WIN32)
    #if defined(PARLEY_LIB_BUILD)
        #define PARLEY_API __declspec(dllexport)
    #else
        #define PARLEY_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(PARLEY_LIB_BUILD)
        #define PARLEY_API __attribute__((visibility("default")))
    #else
        #define PARLEY_API
    #endif
#endif

enum class ParleyErrc {
    Unknown = 1, InvalidConfiguration, EndOfInput, Io, Template, Lookup,
};
struct PARLEY_API ParleyError : public std::runtime_error {
    explicit ParleyError(const std::string& what)
        : std::runtime_error(what), code_(ParleyErrc::Unknown) {}
    ParleyError(ParleyErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ParleyErrc code() const noexcept { return code_; }
private:
    ParleyErrc code_;
};

// Conditions the answer pipeline turns into a message and a retry.
enum class Recoverable {
    NotValid,
    NotInRange,
    InvalidType,
    NoCompletion,
    AmbiguousCompletion,
    Declined,
};

} // namespace parley
