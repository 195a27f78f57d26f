#include "builtin.h"
#include "header_checks.h"
#include "injection.h"
#include "site_security.h"
#include "site_quality.h"

namespace modules {

namespace {

template <typename T>
engine::ModuleFactory factory() {
    return [] { return std::unique_ptr<engine::TestModule>(new T()); };
}

} // namespace

void register_builtin_modules(engine::Registry& registry) {
    registry.register_module("security_headers", factory<SecurityHeadersModule>());
    registry.register_module("cookie_security", factory<CookieSecurityModule>());
    registry.register_module("cors", factory<CorsModule>());
    registry.register_module("reflected_xss", factory<ReflectedXssModule>());
    registry.register_module("sql_injection", factory<SqlInjectionModule>());
    registry.register_module("command_injection", factory<CommandInjectionModule>());
    registry.register_module("csrf", factory<CsrfModule>());
    registry.register_module("open_redirect", factory<OpenRedirectModule>());
    registry.register_module("info_disclosure", factory<InfoDisclosureModule>());
    registry.register_module("seo", factory<SeoModule>());
    registry.register_module("performance", factory<PerformanceModule>());
    registry.register_module("accessibility", factory<AccessibilityModule>());

    registry.define_profile("quick", {"security_headers", "cookie_security", "seo", "performance"});
    registry.define_profile("security", {"security_headers", "cookie_security", "cors",
                                         "reflected_xss", "sql_injection", "command_injection",
                                         "csrf", "open_redirect", "info_disclosure"});
    registry.define_profile("performance", {"performance"});
}

engine::Registry builtin_registry() {
    engine::Registry registry;
    register_builtin_modules(registry);
    return registry;
}

} // namespace modules
