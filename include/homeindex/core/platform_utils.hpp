#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace homeindex::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// True when the variable is set to a non-empty value not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && ((*v)[0] != '0');
}

// Parses a strictly positive integer from the environment.
// nullopt: unset. 0: set but malformed or non-positive.
inline std::optional<std::int64_t> env_positive_int(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v) return std::nullopt;
    if (v->empty()) return std::int64_t{0};
    char* end = nullptr;
    const long long parsed = std::strtoll(v->c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || parsed <= 0) return std::int64_t{0};
    return static_cast<std::int64_t>(parsed);
}

// Diagnostic logging switch, read on every call so tests can toggle it.
inline bool debug_enabled() noexcept {
    return env_flag("HOMEINDEX_DEBUG");
}

} // namespace homeindex::core
