/**
 * @file registry.cpp
 * @brief Module factory table and profile resolution
 */

#include "registry.h"
#include "core/errors.h"
#include <algorithm>

namespace engine {

static const char* kFullProfile = "full";

void Registry::register_module(const std::string& name, ModuleFactory factory) {
    if (name.empty() || !factory) {
        throw SetupError("registry: module needs a name and a factory");
    }
    if (contains(name)) {
        throw SetupError("registry: module '" + name + "' is already registered");
    }
    factories_.emplace_back(name, std::move(factory));
}

void Registry::define_profile(const std::string& name, const std::vector<std::string>& modules) {
    if (name == kFullProfile) {
        throw SetupError("registry: profile 'full' is reserved");
    }
    profiles_[name] = modules;
}

bool Registry::contains(const std::string& name) const {
    return std::any_of(factories_.begin(), factories_.end(),
                       [&](const auto& entry) { return entry.first == name; });
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& entry : factories_) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> Registry::profiles() const {
    std::vector<std::string> out;
    for (const auto& p : profiles_) {
        out.push_back(p.first);
    }
    out.push_back(kFullProfile);
    return out;
}

std::unique_ptr<TestModule> Registry::create(const std::string& name) const {
    for (const auto& entry : factories_) {
        if (entry.first == name) {
            return entry.second();
        }
    }
    return nullptr;
}

std::vector<std::string> Registry::resolve(const std::vector<std::string>& explicit_modules,
                                           const std::string& profile) const {
    std::vector<std::string> wanted;
    if (!explicit_modules.empty()) {
        wanted = explicit_modules;
    } else if (profile == kFullProfile) {
        wanted = names();
    } else {
        auto it = profiles_.find(profile);
        if (it == profiles_.end()) {
            throw SetupError("unknown profile '" + profile + "'");
        }
        wanted = it->second;
    }

    std::vector<std::string> out;
    for (const auto& name : wanted) {
        if (!contains(name)) {
            throw SetupError("unknown module '" + name + "'");
        }
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    }
    return out;
}

} // namespace engine
