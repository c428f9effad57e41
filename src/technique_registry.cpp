#include <inquest/technique_registry.h>

#include <inquest/builtin_techniques.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace inquest {

void TechniqueRegistry::Register(TechniqueDescriptor descriptor) {
  if (descriptor.name.empty()) {
    throw std::invalid_argument("Technique name cannot be empty");
  }
  if (!descriptor.run) {
    throw std::invalid_argument("Run function for technique '" +
                                descriptor.name + "' cannot be null");
  }
  if (descriptor.is_global && descriptor.file_predicate) {
    throw std::invalid_argument("Global technique '" + descriptor.name +
                                "' cannot carry a file predicate");
  }
  if (Find(descriptor.name) != nullptr) {
    throw std::invalid_argument("Technique with name '" + descriptor.name +
                                "' already registered");
  }
  techniques_.push_back(std::move(descriptor));
}

std::vector<std::string> TechniqueRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(techniques_.size());
  for (const auto &technique : techniques_) {
    names.push_back(technique.name);
  }
  return names;
}

const TechniqueDescriptor *
TechniqueRegistry::Find(const std::string &name) const {
  const auto found =
      std::find_if(techniques_.begin(), techniques_.end(),
                   [&](const auto &technique) { return technique.name == name; });
  if (found == techniques_.end()) {
    return nullptr;
  }
  return &*found;
}

std::vector<TechniqueDescriptor>
TechniqueRegistry::Select(const std::vector<std::string> &names) const {
  if (names.empty()) {
    return techniques_;
  }
  for (const auto &name : names) {
    if (Find(name) == nullptr) {
      throw std::invalid_argument("Unknown technique '" + name +
                                  "'. Registered: " + JoinNames());
    }
  }
  std::vector<TechniqueDescriptor> selected;
  for (const auto &technique : techniques_) {
    if (std::find(names.begin(), names.end(), technique.name) != names.end()) {
      selected.push_back(technique);
    }
  }
  return selected;
}

std::string TechniqueRegistry::JoinNames() const {
  std::string message;
  for (std::size_t i = 0; i < techniques_.size(); ++i) {
    message += techniques_[i].name;
    if (i + 1 < techniques_.size()) {
      message += ", ";
    }
  }
  return message;
}

TechniqueRegistry MakeTechniqueRegistryWithDefaults() {
  TechniqueRegistry registry;
  RegisterBuiltinTechniques(registry);
  return registry;
}

} // namespace inquest
