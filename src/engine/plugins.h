#pragma once
#include "registry.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace engine {

/**
 * Extension points around a scan. Every method has a no-op default;
 * exceptions thrown by a hook are caught by the host and reported, they
 * never stop the scan.
 */
class ScanHook {
public:
    virtual ~ScanHook() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Called before crawling
     * @return Object merged into TestContext::additions
     */
    virtual nlohmann::json pre_scan(const ScanConfig& config) {
        (void)config;
        return nlohmann::json::object();
    }

    /// Called after crawling, before modules are resolved
    virtual void register_modules(Registry& registry) { (void)registry; }

    /// Called once the result is final
    virtual void post_scan(const ScanResult& result) { (void)result; }
};

// C entry points a plugin library exports
extern "C" {
typedef ScanHook* (*sitecheck_create_hook_fn)();
typedef void (*sitecheck_destroy_hook_fn)(ScanHook*);
}

struct HookError {
    std::string hook;
    std::string stage;     // "pre_scan", "register_modules", "post_scan"
    std::string message;
};

/**
 * Owns the hooks of a scan: in-process ones added directly and ones
 * loaded from shared libraries. Library hooks are destroyed through the
 * library's own destroy function before the library is closed.
 */
class PluginHost {
public:
    PluginHost() = default;
    ~PluginHost();

    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;

    void add(std::shared_ptr<ScanHook> hook);

    /**
     * @brief Load a hook from a shared library
     * @param path Library exporting sitecheck_create_hook / sitecheck_destroy_hook
     * @param error Set when the library or its entry points are missing
     * @return false if nothing was loaded
     */
    bool load_library(const std::string& path, std::string& error);

    /**
     * @brief Run every pre_scan hook and merge the additions (later hooks win)
     * @param errors Receives one entry per failing hook
     */
    nlohmann::json pre_scan(const ScanConfig& config, std::vector<HookError>& errors);

    void register_modules(Registry& registry, std::vector<HookError>& errors);

    void post_scan(const ScanResult& result, std::vector<HookError>& errors);

    size_t size() const { return hooks_.size(); }

private:
    struct Library {
        void* handle = nullptr;
        std::string path;
    };

    std::vector<std::shared_ptr<ScanHook>> hooks_;
    std::vector<Library> libraries_;
};

} // namespace engine
