/**
 * @file html_extractor.cpp
 * @brief Link, form and page-fact extraction using gumbo
 */

#include "html_extractor.h"
#include "core/url.h"
#include <gumbo.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <utility>

/// Convert string copy to lowercase using lambda on each character.
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}

static const char* attr_of(GumboNode* node, const char* name) {
    GumboAttribute* a = gumbo_get_attribute(&node->v.element.attributes, name);
    return a ? a->value : nullptr;
}

/// Concatenated text of all descendants, whitespace collapsed.
static std::string text_of(GumboNode* node) {
    std::string raw;
    std::vector<GumboNode*> stack{node};
    while (!stack.empty()) {
        GumboNode* n = stack.back();
        stack.pop_back();
        if (n->type == GUMBO_NODE_TEXT || n->type == GUMBO_NODE_WHITESPACE || n->type == GUMBO_NODE_CDATA) {
            raw += n->v.text.text;
        } else if (n->type == GUMBO_NODE_ELEMENT) {
            GumboVector* children = &n->v.element.children;
            for (unsigned int i = children->length; i > 0; i--) {
                stack.push_back(static_cast<GumboNode*>(children->data[i - 1]));
            }
        }
    }

    std::string out;
    bool space = false;
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
        } else {
            if (space) out += ' ';
            out += c;
            space = false;
        }
    }
    return out;
}

static void push_children(GumboNode* node, std::vector<std::pair<GumboNode*, bool>>& stack, bool in_label) {
    GumboVector* children = &node->v.element.children;
    // Reverse push keeps document order on pop
    for (unsigned int i = children->length; i > 0; i--) {
        GumboNode* child = static_cast<GumboNode*>(children->data[i - 1]);
        if (child && child->type == GUMBO_NODE_ELEMENT) {
            stack.emplace_back(child, in_label);
        }
    }
}

/// Collect the fields of one <form>; `label_for` holds every <label for=...> id.
static Form extract_form(GumboNode* form_node, const std::string& page_url,
                         const std::set<std::string>& label_for) {
    Form form;
    const char* action = attr_of(form_node, "action");
    auto resolved = (action && *action) ? urls::resolve(page_url, action) : std::nullopt;
    form.action = resolved ? *resolved : page_url;
    const char* method = attr_of(form_node, "method");
    form.method = method && *method ? to_upper(method) : "GET";

    // Iterative DFS carrying "inside a <label>" down the tree
    std::vector<std::pair<GumboNode*, bool>> stack;
    push_children(form_node, stack, false);
    while (!stack.empty()) {
        auto [n, in_label] = stack.back();
        stack.pop_back();

        GumboTag tag = n->v.element.tag;
        if (tag == GUMBO_TAG_INPUT || tag == GUMBO_TAG_TEXTAREA || tag == GUMBO_TAG_SELECT) {
            FormField field;
            const char* name = attr_of(n, "name");
            const char* id = attr_of(n, "id");
            field.name = name ? name : "";
            field.id = id ? id : "";
            if (tag == GUMBO_TAG_INPUT) {
                const char* type = attr_of(n, "type");
                field.type = type && *type ? to_lower(type) : "text";
            } else {
                field.type = tag == GUMBO_TAG_TEXTAREA ? "textarea" : "select";
            }
            const char* value = attr_of(n, "value");
            if (value) field.value = value;
            field.labelled = in_label ||
                             (!field.id.empty() && label_for.count(field.id)) ||
                             attr_of(n, "aria-label") || attr_of(n, "aria-labelledby");
            // Nameless and id-less fields are not addressable
            if (!field.name.empty() || !field.id.empty()) {
                form.fields.push_back(std::move(field));
            }
        }
        push_children(n, stack, in_label || tag == GUMBO_TAG_LABEL);
    }
    return form;
}

HtmlFacts extract_html(const std::string& page_url, const std::string& body) {
    HtmlFacts facts;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, body.data(), body.size());
    if (!output) return facts;

    // First pass: ids referenced by <label for>
    std::set<std::string> label_for;
    std::vector<GumboNode*> stack{output->root};
    while (!stack.empty()) {
        GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;
        if (node->v.element.tag == GUMBO_TAG_LABEL) {
            if (const char* f = attr_of(node, "for")) label_for.insert(f);
        }
        GumboVector* children = &node->v.element.children;
        for (unsigned int i = 0; i < children->length; i++) {
            stack.push_back(static_cast<GumboNode*>(children->data[i]));
        }
    }

    std::set<std::string> seen_links;
    std::vector<GumboNode*> forms;
    stack.assign(1, output->root);
    while (!stack.empty()) {
        GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        switch (node->v.element.tag) {
            case GUMBO_TAG_HTML:
                if (const char* lang = attr_of(node, "lang")) facts.html_lang = lang;
                break;
            case GUMBO_TAG_TITLE:
                if (!facts.has_title) {
                    facts.has_title = true;
                    facts.title = text_of(node);
                }
                break;
            case GUMBO_TAG_META: {
                const char* name = attr_of(node, "name");
                if (!name) name = attr_of(node, "property");
                const char* content = attr_of(node, "content");
                if (name && content) facts.meta_tags.emplace(to_lower(name), content);
                break;
            }
            case GUMBO_TAG_LINK: {
                const char* rel = attr_of(node, "rel");
                const char* href = attr_of(node, "href");
                if (rel && href) {
                    std::string r = to_lower(rel);
                    auto resolved = urls::resolve(page_url, href);
                    if (resolved && r == "canonical" && facts.canonical_url.empty()) {
                        facts.canonical_url = *resolved;
                    } else if (resolved && r.find("stylesheet") != std::string::npos) {
                        facts.stylesheets.push_back(*resolved);
                    }
                }
                break;
            }
            case GUMBO_TAG_H1:
                facts.h1_count++;
                break;
            case GUMBO_TAG_A: {
                const char* href = attr_of(node, "href");
                if (href) {
                    auto resolved = urls::resolve(page_url, href);
                    if (resolved && seen_links.insert(*resolved).second) {
                        facts.links.push_back(*resolved);
                    }
                }
                break;
            }
            case GUMBO_TAG_SCRIPT: {
                const char* src = attr_of(node, "src");
                if (src) {
                    if (auto resolved = urls::resolve(page_url, src)) facts.scripts.push_back(*resolved);
                } else {
                    std::string code = text_of(node);
                    if (!code.empty()) facts.inline_scripts.push_back(std::move(code));
                }
                break;
            }
            case GUMBO_TAG_IMG: {
                ImageRef img;
                const char* src = attr_of(node, "src");
                img.src = src ? src : "";
                img.has_alt = attr_of(node, "alt") != nullptr;
                facts.images.push_back(std::move(img));
                break;
            }
            case GUMBO_TAG_FORM:
                forms.push_back(node);
                break;
            default:
                break;
        }

        // Reverse push keeps document order
        GumboVector* children = &node->v.element.children;
        for (unsigned int i = children->length; i > 0; i--) {
            GumboNode* child = static_cast<GumboNode*>(children->data[i - 1]);
            if (child) stack.push_back(child);
        }
    }

    for (GumboNode* f : forms) {
        facts.forms.push_back(extract_form(f, page_url, label_for));
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return facts;
}

void apply_facts(const HtmlFacts& facts, CrawledPage& page) {
    page.links = facts.links;
    page.forms = facts.forms;
    page.title = facts.title;
    page.has_title = facts.has_title;
    page.meta_tags = facts.meta_tags;
    page.canonical_url = facts.canonical_url;
    page.html_lang = facts.html_lang;
    page.h1_count = facts.h1_count;
    page.scripts = facts.scripts;
    page.stylesheets = facts.stylesheets;
    page.images = facts.images;
}

std::vector<ScriptCall> find_script_calls(const std::string& code) {
    static const std::regex fetch_re(R"(fetch\(\s*["'`]([^"'`]+)["'`])", std::regex::icase);
    static const std::regex axios_re(R"(axios\.(get|post|put|delete|patch|head)\(\s*["'`]([^"'`]+)["'`])", std::regex::icase);
    static const std::regex ajax_re(R"(\$\.ajax\(\{[^}]*url\s*:\s*["']([^"']+)["'])", std::regex::icase);
    static const std::regex xhr_re(R"(\.open\(\s*["']([A-Za-z]+)["']\s*,\s*["']([^"']+)["'])");
    static const std::regex path_re(R"(["'](/(?:api|graphql|rest|v\d+)/[^"'\s]*)["'])", std::regex::icase);

    std::vector<ScriptCall> calls;
    std::set<std::pair<std::string, std::string>> seen;
    auto add = [&](std::string method, std::string url) {
        if (url.empty()) return;
        if (seen.emplace(method, url).second) {
            calls.push_back({std::move(method), std::move(url)});
        }
    };

    for (auto it = std::sregex_iterator(code.begin(), code.end(), fetch_re); it != std::sregex_iterator(); ++it) {
        add("UNKNOWN", (*it)[1].str());
    }
    for (auto it = std::sregex_iterator(code.begin(), code.end(), axios_re); it != std::sregex_iterator(); ++it) {
        add(to_upper((*it)[1].str()), (*it)[2].str());
    }
    for (auto it = std::sregex_iterator(code.begin(), code.end(), ajax_re); it != std::sregex_iterator(); ++it) {
        add("UNKNOWN", (*it)[1].str());
    }
    for (auto it = std::sregex_iterator(code.begin(), code.end(), xhr_re); it != std::sregex_iterator(); ++it) {
        add(to_upper((*it)[1].str()), (*it)[2].str());
    }
    for (auto it = std::sregex_iterator(code.begin(), code.end(), path_re); it != std::sregex_iterator(); ++it) {
        std::string url = (*it)[1].str();
        // Already reported with a method by one of the call patterns
        bool known = std::any_of(calls.begin(), calls.end(), [&](const ScriptCall& c) { return c.url == url; });
        if (!known) add("UNKNOWN", url);
    }
    return calls;
}
