#pragma once
#include <optional>
#include <string>
#include <vector>

// robots.txt rules for one user agent.
// The group whose User-agent token occurs in our agent name wins (longest
// token first); otherwise the "*" group applies; with neither, everything
// is allowed. Within the group the longest matching Allow/Disallow pattern
// decides, Allow winning ties. Patterns support '*' and a trailing '$'.

class RobotsRules {
public:
    /**
     * @brief Parse a robots.txt document
     * @param body File contents
     * @param user_agent Our agent name (e.g. "sitecheck/1.0")
     */
    static RobotsRules parse(const std::string& body, const std::string& user_agent);

    /// Rules that allow every path (missing or unreadable robots.txt)
    static RobotsRules allow_all() { return RobotsRules(); }

    /**
     * @brief Check whether a path may be fetched
     * @param path URL path, optionally with query ("/a/b?x=1")
     */
    bool allows(const std::string& path) const;

    std::optional<double> crawl_delay() const { return crawl_delay_; }
    const std::vector<std::string>& sitemaps() const { return sitemaps_; }
    size_t rule_count() const { return rules_.size(); }

private:
    struct Rule {
        std::string pattern;
        bool allow;
    };

    std::vector<Rule> rules_;
    std::optional<double> crawl_delay_;
    std::vector<std::string> sitemaps_;

    static bool matches(const std::string& pattern, const std::string& path);
};
