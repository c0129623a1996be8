/**
 * @file content_parser.cpp
 * @brief JSON, XML and HTML inspection using nlohmann::json, libxml2 and gumbo
 */

#include "content_parser.h"
#include <gumbo.h>
#include <libxml/parser.h>
#include <curl/curl.h>
#include <algorithm>
#include <mutex>
#include <set>

/// Convert string copy to lowercase using lambda on each character.
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool parse_json(const std::string& body, nlohmann::json& out, std::string& error) {
    out = nlohmann::json::parse(body, nullptr, false);
    if (out.is_discarded()) {
        error = body.empty() ? "empty body" : "invalid JSON";
        return false;
    }
    return true;
}

/// libxml2 wants xmlInitParser() once before parsing from several threads.
static void ensure_libxml_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

bool is_well_formed_xml(const std::string& body) {
    if (body.empty()) return false;
    ensure_libxml_initialized();

    const int flags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    xmlDocPtr doc = xmlReadMemory(body.data(), static_cast<int>(body.size()), "probe.xml", nullptr, flags);
    if (!doc) return false;
    bool ok = xmlDocGetRootElement(doc) != nullptr;
    xmlFreeDoc(doc);
    return ok;
}

/// Concatenate the text children of an element.
static std::string element_text(const GumboNode* node) {
    std::string text;
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; i++) {
        const GumboNode* child = static_cast<const GumboNode*>(children->data[i]);
        if (child && (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA)) {
            text += child->v.text.text;
        }
    }
    return text;
}

/// Collect named inputs of a form with an iterative DFS.
static void collect_form_inputs(GumboNode* form_node, HtmlForm& form) {
    std::vector<GumboNode*> stack;
    stack.push_back(form_node);
    while (!stack.empty()) {
        GumboNode* n = stack.back();
        stack.pop_back();
        if (n->type != GUMBO_NODE_ELEMENT) continue;
        if (
            n->v.element.tag == GUMBO_TAG_INPUT    ||
            n->v.element.tag == GUMBO_TAG_TEXTAREA ||
            n->v.element.tag == GUMBO_TAG_SELECT
        ) {
            GumboAttribute* name_attr = gumbo_get_attribute(&n->v.element.attributes, "name");
            if (name_attr) {
                GumboAttribute* val_attr = gumbo_get_attribute(&n->v.element.attributes, "value");
                form.inputs.emplace_back(name_attr->value, val_attr ? val_attr->value : "");
            }
        }
        GumboVector* children = &n->v.element.children;
        for (unsigned int i = children->length; i > 0; i--) {
            GumboNode* child = static_cast<GumboNode*>(children->data[i - 1]);
            if (child) stack.push_back(child);
        }
    }
}

MarkupScan extract_markup(const std::string& body) {
    MarkupScan scan;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, body.data(), body.size());
    if (!output) return scan;

    // Document-order DFS: children are pushed in reverse
    std::vector<GumboNode*> stack;
    stack.push_back(output->root);
    while (!stack.empty()) {
        GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        GumboAttribute* attr = nullptr;
        switch (node->v.element.tag) {
            case GUMBO_TAG_SCRIPT: {
                std::string text = element_text(node);
                if (!text.empty()) scan.scripts.push_back(std::move(text));
                break;
            }
            case GUMBO_TAG_FORM: {
                HtmlForm form;
                attr = gumbo_get_attribute(&node->v.element.attributes, "action");
                form.action = attr ? std::string(attr->value) : "";
                attr = gumbo_get_attribute(&node->v.element.attributes, "method");
                form.method = attr ? to_lower(attr->value) : "get";
                collect_form_inputs(node, form);
                scan.forms.push_back(std::move(form));
                break;
            }
            case GUMBO_TAG_A:
                attr = gumbo_get_attribute(&node->v.element.attributes, "href");
                if (attr && attr->value[0] != '\0' && attr->value[0] != '#') {
                    scan.links.emplace_back(attr->value);
                }
                break;
            default:
                break;
        }

        GumboVector* children = &node->v.element.children;
        for (unsigned int i = children->length; i > 0; i--) {
            GumboNode* child = static_cast<GumboNode*>(children->data[i - 1]);
            if (child) stack.push_back(child);
        }
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return scan;
}

std::vector<std::string> find_script_endpoints(const std::string& script) {
    std::vector<std::string> found;
    std::set<std::string> seen;

    size_t i = 0;
    while (i < script.size()) {
        char quote = script[i];
        if (quote != '"' && quote != '\'' && quote != '`') {
            i++;
            continue;
        }
        size_t end = i + 1;
        while (end < script.size() && script[end] != quote && script[end] != '\n') {
            if (script[end] == '\\') end++;
            end++;
        }
        if (end >= script.size() || script[end] != quote) {
            i = end;
            continue;
        }

        std::string literal = script.substr(i + 1, end - i - 1);
        i = end + 1;

        std::string lower = to_lower(literal);
        bool looks_like_url = lower.rfind("/", 0) == 0 ||
                              lower.rfind("http://", 0) == 0 ||
                              lower.rfind("https://", 0) == 0;
        if (!looks_like_url || literal.find_first_of(" \t<>") != std::string::npos) continue;

        bool mentions_api = lower.find("/api/") != std::string::npos ||
                            lower.find("search") != std::string::npos ||
                            lower.find("query") != std::string::npos;
        if (mentions_api && seen.insert(literal).second) {
            found.push_back(std::move(literal));
        }
    }
    return found;
}

std::string resolve_url(const std::string& base, const std::string& href) {
    if (href.empty()) return {};

    CURLU* h = curl_url();
    if (!h) return {};
    if (curl_url_set(h, CURLUPART_URL, base.c_str(), 0) != CURLUE_OK ||
        curl_url_set(h, CURLUPART_URL, href.c_str(), CURLU_URLENCODE) != CURLUE_OK) {
        curl_url_cleanup(h);
        return {};
    }
    curl_url_set(h, CURLUPART_FRAGMENT, nullptr, 0);

    std::string out;
    char* full = nullptr;
    if (curl_url_get(h, CURLUPART_URL, &full, 0) == CURLUE_OK && full) {
        out = full;
        curl_free(full);
    }
    curl_url_cleanup(h);
    return out;
}
