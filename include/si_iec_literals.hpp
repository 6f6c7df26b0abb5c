#pragma once

#include <cstddef>

// binary size suffixes, e.g., 128_Ki for a chunk of 131072 bytes

constexpr size_t operator"" _Ki(unsigned long long s) { return s << 10ULL; }
constexpr size_t operator"" _Mi(unsigned long long s) { return s << 20ULL; }
