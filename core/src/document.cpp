#include "scrapeguard/document.h"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <cctype>
#include <climits>
#include <cstring>
#include <regex>

namespace scrapeguard {

namespace {

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r' || s[b] == '\f' || s[b] == '\v')) b++;
    while (e > b && (s[e-1] == ' ' || s[e-1] == '\t' || s[e-1] == '\n' || s[e-1] == '\r' || s[e-1] == '\f' || s[e-1] == '\v')) e--;
    return s.substr(b, e - b);
}

bool is_element(xmlNodePtr n, const char* name) {
    return n->type == XML_ELEMENT_NODE && xmlStrcasecmp(n->name, BAD_CAST name) == 0;
}

std::string node_content(xmlNodePtr n) {
    xmlChar* c = xmlNodeGetContent(n);
    if (!c) return "";
    std::string out(reinterpret_cast<const char*>(c));
    xmlFree(c);
    return out;
}

xmlNodePtr find_first(xmlNodePtr node, const char* name) {
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (is_element(cur, name)) return cur;
        if (cur->children) {
            if (xmlNodePtr found = find_first(cur->children, name)) return found;
        }
    }
    return nullptr;
}

void collect_text(xmlNodePtr node, std::string& out) {
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (cur->type == XML_ELEMENT_NODE) {
            if (is_element(cur, "script") || is_element(cur, "style") || is_element(cur, "noscript")) continue;
            if (cur->children) collect_text(cur->children, out);
        } else if (cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE) {
            if (!cur->content) continue;
            std::string t = trim_ws(reinterpret_cast<const char*>(cur->content));
            if (t.empty()) continue;
            if (!out.empty()) out.push_back(' ');
            out += t;
        }
    }
}

void collect_elements(xmlNodePtr node, const char* name, std::vector<xmlNodePtr>& out) {
    const bool any = std::strcmp(name, "*") == 0;
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (any ? cur->type == XML_ELEMENT_NODE : is_element(cur, name)) out.push_back(cur);
        if (cur->children) collect_elements(cur->children, name, out);
    }
}

} // namespace

Document::Document(std::string url, std::string html)
    : url_(std::move(url)), html_(std::move(html)) {
    if (html_.empty() || html_.size() > static_cast<size_t>(INT_MAX)) return;
    doc_ = htmlReadMemory(html_.data(),
                          static_cast<int>(html_.size()),
                          url_.c_str(),
                          nullptr,
                          HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
}

Document::~Document() {
    if (doc_) xmlFreeDoc(static_cast<xmlDocPtr>(doc_));
}

std::string Document::title() const {
    if (!doc_) return "";
    xmlNodePtr root = xmlDocGetRootElement(static_cast<xmlDocPtr>(doc_));
    if (!root) return "";
    xmlNodePtr t = find_first(root, "title");
    if (!t) return "";
    return trim_ws(node_content(t));
}

std::string Document::text() const {
    if (!doc_) return "";
    xmlNodePtr root = xmlDocGetRootElement(static_cast<xmlDocPtr>(doc_));
    std::string out;
    if (root) collect_text(root, out);
    return out;
}

std::vector<std::string> Document::links() const {
    std::vector<std::string> out;
    if (!doc_) return out;
    xmlNodePtr root = xmlDocGetRootElement(static_cast<xmlDocPtr>(doc_));
    if (!root) return out;
    std::vector<xmlNodePtr> anchors;
    collect_elements(root, "a", anchors);
    for (xmlNodePtr a : anchors) {
        xmlChar* href = xmlGetProp(a, BAD_CAST "href");
        if (!href) continue;
        std::string h = trim_ws(reinterpret_cast<const char*>(href));
        xmlFree(href);
        if (!h.empty()) out.push_back(std::move(h));
    }
    return out;
}

std::vector<std::string> Document::texts_of(const std::string& tag) const {
    std::vector<std::string> out;
    if (!doc_ || tag.empty()) return out;
    xmlNodePtr root = xmlDocGetRootElement(static_cast<xmlDocPtr>(doc_));
    if (!root) return out;
    std::vector<xmlNodePtr> nodes;
    collect_elements(root, tag.c_str(), nodes);
    out.reserve(nodes.size());
    for (xmlNodePtr n : nodes) {
        std::string t;
        collect_text(n->children, t);
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<Element> Document::elements(const std::string& tag) const {
    std::vector<Element> out;
    if (!doc_ || tag.empty()) return out;
    xmlNodePtr root = xmlDocGetRootElement(static_cast<xmlDocPtr>(doc_));
    if (!root) return out;
    std::vector<xmlNodePtr> nodes;
    collect_elements(root, tag.c_str(), nodes);
    out.reserve(nodes.size());
    for (xmlNodePtr n : nodes) {
        Element e;
        e.tag = reinterpret_cast<const char*>(n->name);
        for (auto& c : e.tag) c = (char)std::tolower((unsigned char)c);
        collect_text(n->children, e.text);
        for (xmlAttrPtr a = n->properties; a; a = a->next) {
            xmlChar* v = xmlNodeListGetString(n->doc, a->children, 1);
            e.attrs.emplace_back(reinterpret_cast<const char*>(a->name),
                                 v ? reinterpret_cast<const char*>(v) : "");
            if (v) xmlFree(v);
        }
        out.push_back(std::move(e));
    }
    return out;
}

bool Document::looks_dynamic() const {
    const std::string t = text();
    if (t.size() < 100) return true;
    if (!doc_) return true;
    xmlNodePtr root = xmlDocGetRootElement(static_cast<xmlDocPtr>(doc_));
    if (!root) return true;

    static const std::regex framework_src("(react|vue|angular|jquery)", std::regex::icase);
    static const std::regex app_id("app|root|main", std::regex::icase);
    static const std::regex app_class("app|root|main|container", std::regex::icase);

    auto attr = [](xmlNodePtr n, const char* name, bool* present) {
        xmlChar* v = xmlGetProp(n, BAD_CAST name);
        if (present) *present = (v != nullptr);
        if (!v) return std::string();
        std::string out(reinterpret_cast<const char*>(v));
        xmlFree(v);
        return out;
    };

    bool framework = false, react_root = false, ng_app = false, app_ids = false, app_divs = false;
    std::vector<xmlNodePtr> stack{root};
    while (!stack.empty()) {
        xmlNodePtr n = stack.back();
        stack.pop_back();
        for (xmlNodePtr cur = n; cur; cur = cur->next) {
            if (cur->type != XML_ELEMENT_NODE) continue;
            bool present = false;
            if (is_element(cur, "script") && std::regex_search(attr(cur, "src", nullptr), framework_src)) framework = true;
            attr(cur, "data-reactroot", &present);
            if (present) react_root = true;
            attr(cur, "ng-app", &present);
            if (present) ng_app = true;
            if (std::regex_search(attr(cur, "id", nullptr), app_id)) app_ids = true;
            if (is_element(cur, "div") && std::regex_search(attr(cur, "class", nullptr), app_class)) app_divs = true;
            if (cur->children) stack.push_back(cur->children);
        }
    }
    const int score = (int)framework + (int)react_root + (int)ng_app + (int)app_ids + (int)app_divs;
    return score >= 2;
}

std::shared_ptr<const Document> make_document(const std::string& url, const std::string& html) {
    return std::make_shared<const Document>(url, html);
}

} // namespace scrapeguard
