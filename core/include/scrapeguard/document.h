#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scrapeguard {

struct Element {
    std::string tag;   // lowercased
    std::string text;  // visible text, joined like Document::text()
    std::vector<std::pair<std::string, std::string>> attrs;
};

// A fetched page. Parsed once with libxml2's recovering HTML parser;
// immutable afterwards.
class Document {
public:
    Document(std::string url, std::string html);
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    const std::string& url() const { return url_; }
    const std::string& html() const { return html_; }
    bool parsed() const { return doc_ != nullptr; }

    // Trimmed <title> text; empty when the page has none.
    std::string title() const;

    // Visible text of the page (script/style/noscript skipped), text nodes
    // joined by single spaces.
    std::string text() const;

    // href attributes of <a> elements, in document order.
    std::vector<std::string> links() const;

    // Text content of every element with the given tag name (case-insensitive).
    std::vector<std::string> texts_of(const std::string& tag) const;

    // Elements with the given tag name ("*" for all), in document order.
    std::vector<Element> elements(const std::string& tag) const;

    // Client-rendered page heuristic: framework script references, SPA root
    // markers, app-like container ids/classes, very little static text.
    // Two indicators, or under 100 characters of text, count as dynamic.
    bool looks_dynamic() const;

private:
    std::string url_;
    std::string html_;
    void* doc_{nullptr}; // htmlDocPtr; kept opaque so libxml2 stays out of the header
};

std::shared_ptr<const Document> make_document(const std::string& url, const std::string& html);

} // namespace scrapeguard
