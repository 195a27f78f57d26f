/**
 * @file plugins.cpp
 * @brief Scan hooks and shared-library plugin loading
 */

#include "plugins.h"
#include "logging/console.h"
#include <dlfcn.h>

namespace engine {

PluginHost::~PluginHost() {
    // Library-owned hooks hold a deleter that calls into the library
    hooks_.clear();
    for (auto it = libraries_.rbegin(); it != libraries_.rend(); ++it) {
        if (it->handle) {
            ::dlclose(it->handle);
        }
    }
}

void PluginHost::add(std::shared_ptr<ScanHook> hook) {
    if (hook) {
        hooks_.push_back(std::move(hook));
    }
}

bool PluginHost::load_library(const std::string& path, std::string& error) {
    void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* msg = ::dlerror();
        error = "cannot load " + path + ": " + (msg ? msg : "unknown error");
        return false;
    }

    auto create = reinterpret_cast<sitecheck_create_hook_fn>(::dlsym(handle, "sitecheck_create_hook"));
    auto destroy = reinterpret_cast<sitecheck_destroy_hook_fn>(::dlsym(handle, "sitecheck_destroy_hook"));
    if (!create || !destroy) {
        error = path + " does not export sitecheck_create_hook and sitecheck_destroy_hook";
        ::dlclose(handle);
        return false;
    }

    ScanHook* raw = create();
    if (!raw) {
        error = path + ": sitecheck_create_hook returned null";
        ::dlclose(handle);
        return false;
    }

    libraries_.push_back(Library{handle, path});
    hooks_.push_back(std::shared_ptr<ScanHook>(raw, destroy));
    logging::info("plugin loaded: " + raw->name() + " (" + path + ")");
    return true;
}

nlohmann::json PluginHost::pre_scan(const ScanConfig& config, std::vector<HookError>& errors) {
    nlohmann::json additions = nlohmann::json::object();
    for (const auto& hook : hooks_) {
        try {
            nlohmann::json extra = hook->pre_scan(config);
            if (extra.is_object()) {
                additions.update(extra);
            } else if (!extra.is_null()) {
                errors.push_back({hook->name(), "pre_scan", "additions must be a JSON object"});
            }
        } catch (const std::exception& e) {
            errors.push_back({hook->name(), "pre_scan", e.what()});
        }
    }
    return additions;
}

void PluginHost::register_modules(Registry& registry, std::vector<HookError>& errors) {
    for (const auto& hook : hooks_) {
        try {
            hook->register_modules(registry);
        } catch (const std::exception& e) {
            errors.push_back({hook->name(), "register_modules", e.what()});
        }
    }
}

void PluginHost::post_scan(const ScanResult& result, std::vector<HookError>& errors) {
    for (const auto& hook : hooks_) {
        try {
            hook->post_scan(result);
        } catch (const std::exception& e) {
            errors.push_back({hook->name(), "post_scan", e.what()});
        }
    }
}

} // namespace engine
