#pragma once

#include <inquest/technique.h>
#include <inquest/technique_registry.h>

namespace inquest {

inline constexpr unsigned kLongFunctionLineBudget = 60;

TechniqueDescriptor MakeTodoCommentsTechnique();
TechniqueDescriptor MakeLongFunctionsTechnique();
TechniqueDescriptor MakeDuplicateFilesTechnique();

// Registers todo-comments, long-functions and duplicate-files, in that order.
void RegisterBuiltinTechniques(TechniqueRegistry &registry);

} // namespace inquest
