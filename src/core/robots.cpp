/**
 * @file robots.cpp
 * @brief robots.txt parsing and path matching
 */

#include "robots.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

RobotsRules RobotsRules::parse(const std::string& body, const std::string& user_agent) {
    struct Group {
        std::vector<std::string> agents;
        std::vector<Rule> rules;
        std::optional<double> delay;
    };

    std::vector<Group> groups;
    std::vector<std::string> sitemaps;
    bool in_agent_lines = false;

    std::istringstream ss(body);
    std::string line;
    while (std::getline(ss, line)) {
        // Strip comments and CR
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string field = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (field == "user-agent") {
            // Consecutive User-agent lines share one group
            if (!in_agent_lines || groups.empty()) {
                groups.emplace_back();
            }
            groups.back().agents.push_back(to_lower(value));
            in_agent_lines = true;
            continue;
        }
        in_agent_lines = false;

        if (field == "sitemap") {
            if (!value.empty()) sitemaps.push_back(value);
            continue;
        }
        if (groups.empty()) continue;

        if (field == "disallow") {
            // Empty Disallow means "allow everything"
            if (!value.empty()) groups.back().rules.push_back({value, false});
        } else if (field == "allow") {
            if (!value.empty()) groups.back().rules.push_back({value, true});
        } else if (field == "crawl-delay") {
            try {
                groups.back().delay = std::stod(value);
            } catch (const std::exception&) {
                // unparsable delay is ignored
            }
        }
    }

    // Our product token: "sitecheck/1.0" -> "sitecheck"
    std::string ua = to_lower(user_agent);
    std::string product = ua.substr(0, ua.find('/'));

    const Group* best = nullptr;
    size_t best_len = 0;
    const Group* wildcard = nullptr;
    for (const auto& g : groups) {
        for (const auto& agent : g.agents) {
            if (agent == "*") {
                if (!wildcard) wildcard = &g;
            } else if (!agent.empty() && product.find(agent) != std::string::npos && agent.size() > best_len) {
                best = &g;
                best_len = agent.size();
            }
        }
    }

    RobotsRules rules;
    rules.sitemaps_ = std::move(sitemaps);
    const Group* chosen = best ? best : wildcard;
    if (chosen) {
        rules.rules_ = chosen->rules;
        rules.crawl_delay_ = chosen->delay;
    }
    return rules;
}

bool RobotsRules::matches(const std::string& pattern, const std::string& path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    std::string pat = anchored ? pattern.substr(0, pattern.size() - 1) : pattern;

    // Greedy glob match with backtracking on the last '*'
    size_t p = 0, s = 0;
    size_t star = std::string::npos, mark = 0;
    while (s < path.size()) {
        if (p < pat.size() && pat[p] == '*') {
            star = p++;
            mark = s;
        } else if (p < pat.size() && pat[p] == path[s]) {
            p++;
            s++;
        } else if (p == pat.size() && !anchored) {
            return true;    // prefix match
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++mark;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') p++;
    return p == pat.size();
}

bool RobotsRules::allows(const std::string& path) const {
    std::string target = path.empty() ? "/" : path;
    const Rule* winner = nullptr;
    for (const auto& r : rules_) {
        if (!matches(r.pattern, target)) continue;
        if (!winner || r.pattern.size() > winner->pattern.size() ||
            (r.pattern.size() == winner->pattern.size() && r.allow && !winner->allow)) {
            winner = &r;
        }
    }
    return !winner || winner->allow;
}
