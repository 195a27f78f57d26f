#pragma once
#include "module.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace engine {

using ModuleFactory = std::function<std::unique_ptr<TestModule>()>;

/**
 * Compiled-in table of module factories and named profiles.
 * Registration order is kept; the "full" profile is every registered
 * module in that order.
 */
class Registry {
public:
    /**
     * @brief Add a module factory
     * @throws SetupError if name is empty or already registered
     */
    void register_module(const std::string& name, ModuleFactory factory);

    /**
     * @brief Define (or redefine) a named profile
     * @param name Profile name; "full" is reserved
     * @param modules Module names, checked when the profile is resolved
     */
    void define_profile(const std::string& name, const std::vector<std::string>& modules);

    bool contains(const std::string& name) const;

    /// Registered module names in registration order
    std::vector<std::string> names() const;

    /// Profile names, "full" included
    std::vector<std::string> profiles() const;

    /**
     * @brief Instantiate a module
     * @return New instance, or nullptr if name is unknown
     */
    std::unique_ptr<TestModule> create(const std::string& name) const;

    /**
     * @brief Turn a module selection into an ordered list of names
     * @param explicit_modules Names to run; when non-empty the profile is ignored
     * @param profile Profile used when no names are given
     * @return Names without duplicates, in selection order
     * @throws SetupError for unknown modules or profiles
     */
    std::vector<std::string> resolve(const std::vector<std::string>& explicit_modules,
                                     const std::string& profile) const;

private:
    std::vector<std::pair<std::string, ModuleFactory>> factories_;
    std::map<std::string, std::vector<std::string>> profiles_;
};

} // namespace engine
