#pragma once
#include "engine/registry.h"

namespace modules {

/**
 * @brief Register the built-in modules and the quick, security and
 * performance profiles
 * @param registry Registry to fill; must not already hold these names
 */
void register_builtin_modules(engine::Registry& registry);

/// Registry holding only the built-in modules and profiles
engine::Registry builtin_registry();

} // namespace modules
