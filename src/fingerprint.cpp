#include <inquest/fingerprint.h>

#include <iomanip>
#include <sstream>

namespace inquest {
namespace {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

} // namespace

std::uint64_t Fnv1a64(std::string_view data) noexcept {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const auto character : data) {
    hash ^= static_cast<unsigned char>(character);
    hash *= kFnvPrime;
  }
  return hash;
}

std::string ContentFingerprint(std::string_view content) {
  std::ostringstream stream;
  stream << std::hex << std::setw(16) << std::setfill('0') << Fnv1a64(content);
  return stream.str();
}

} // namespace inquest
