#pragma once
#include "cache/cache_store.h"
#include <memory>

class HttpTransport;

namespace cache {

// Shared tier behind a minimal HTTP key/value service:
//   GET    {base}/{key}  -> 200 with envelope, 404 when absent
//   PUT    {base}/{key}  <- envelope
//   DELETE {base}/{key}
//   DELETE {base}/       clears the namespace
// Any other outcome is reported as CacheError.

class RemoteTier : public CacheBackend {
public:
    RemoteTier(std::shared_ptr<const HttpTransport> transport,
               const std::string& base_url,
               long timeout_ms = 2000);

    const char* name() const override { return "remote"; }
    std::optional<CacheEntry> get(const std::string& key) override;
    void set(const std::string& key, const CacheEntry& entry) override;
    void remove(const std::string& key) override;
    void clear() override;

private:
    std::shared_ptr<const HttpTransport> transport_;
    std::string base_url_;
    long timeout_ms_;

    std::string url_for(const std::string& key) const;
};

} // namespace cache
