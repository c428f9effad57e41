#pragma once

#include <inquest/technique.h>

#include <string>
#include <vector>

namespace inquest {

// Ordered, append-only list of techniques. Registration happens once at
// startup; the registry is read-only while a run executes.
class TechniqueRegistry {
public:
  // Throws std::invalid_argument on malformed or duplicate descriptors.
  void Register(TechniqueDescriptor descriptor);

  const std::vector<TechniqueDescriptor> &List() const { return techniques_; }
  std::vector<std::string> Names() const;
  const TechniqueDescriptor *Find(const std::string &name) const;

  // Registration order is kept regardless of the order of `names`. An empty
  // selection returns every technique.
  std::vector<TechniqueDescriptor>
  Select(const std::vector<std::string> &names) const;

private:
  std::string JoinNames() const;

  std::vector<TechniqueDescriptor> techniques_;
};

TechniqueRegistry MakeTechniqueRegistryWithDefaults();

} // namespace inquest
