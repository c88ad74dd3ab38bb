#pragma once

// Unified include for std::expected (C++23). Toolchains without <expected>
// are not supported; the build requests C++23 explicitly.

#if defined(__has_include)
#  if __has_include(<expected>)
#    include <expected>
#  else
#    error "homeindex requires a standard library that provides <expected>"
#  endif
#else
#  include <expected>
#endif
