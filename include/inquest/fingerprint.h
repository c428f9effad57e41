#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace inquest {

// FNV-1a 64-bit over the raw bytes. Change detection only; not suitable for
// anything security-sensitive.
std::uint64_t Fnv1a64(std::string_view data) noexcept;

// Lower-case, zero-padded, 16 hex digits.
std::string ContentFingerprint(std::string_view content);

} // namespace inquest
