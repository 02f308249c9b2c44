#include "test_common.h"
#include "scrapeguard/document.h"

#include <string>

using namespace scrapeguard;

static const char* kPage = R"(<!DOCTYPE html>
<html><head>
  <title>  Acme Widgets  </title>
  <style>body { color: red; }</style>
  <script>var hidden = "do not index";</script>
</head>
<body>
  <h1>Catalogue</h1>
  <p class="item featured" data-id="1">Blue widget</p>
  <P class="item">Red <b>widget</b></P>
  <a href="/about">About</a>
  <a href=" https://example.com/contact ">Contact</a>
  <a>No link</a>
  <noscript>Enable JavaScript</noscript>
  <p>Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor incididunt ut labore et dolore magna aliqua.</p>
</body></html>)";

int main() {
    auto doc = make_document("https://example.com/", kPage);
    expect_true(doc->parsed(), "page should parse");
    expect_true(doc->url() == "https://example.com/", "url kept");

    // Test 1: title trimmed
    expect_true(doc->title() == "Acme Widgets", "title: " + doc->title());

    // Test 2: visible text skips script, style and noscript
    const std::string text = doc->text();
    expect_true(text.find("Catalogue") != std::string::npos, "heading in text");
    expect_true(text.find("Red widget") != std::string::npos, "inline text joined: " + text);
    expect_true(text.find("do not index") == std::string::npos, "script skipped");
    expect_true(text.find("color: red") == std::string::npos, "style skipped");
    expect_true(text.find("Enable JavaScript") == std::string::npos, "noscript skipped");

    // Test 3: links in order, trimmed, anchors without href skipped
    auto links = doc->links();
    expect_eq_ll((long long)links.size(), 2, "two links");
    expect_true(links[0] == "/about", "first link");
    expect_true(links[1] == "https://example.com/contact", "second link trimmed");

    // Test 4: tag lookup is case-insensitive
    auto ps = doc->texts_of("p");
    expect_eq_ll((long long)ps.size(), 3, "three paragraphs");
    expect_true(ps[0] == "Blue widget", "first paragraph");
    expect_true(ps[1] == "Red widget", "uppercase tag matched");

    // Test 5: elements carry lowercase tag, text and attributes
    auto els = doc->elements("p");
    expect_eq_ll((long long)els.size(), 3, "three p elements");
    expect_true(els[0].tag == "p", "tag lowercased");
    bool saw_class = false, saw_id = false;
    for (const auto& [k, v] : els[0].attrs) {
        if (k == "class") saw_class = v == "item featured";
        if (k == "data-id") saw_id = v == "1";
    }
    expect_true(saw_class && saw_id, "attributes captured");
    expect_true(doc->elements("*").size() > els.size(), "wildcard returns all elements");
    expect_true(doc->elements("table").empty(), "missing tag yields nothing");
    expect_true(doc->elements("").empty(), "empty tag yields nothing");

    // Test 6: malformed and empty input
    {
        auto broken = make_document("u", "<html><body><p>unclosed <div>still <b>here");
        expect_true(broken->parsed(), "recovering parser accepts broken markup");
        expect_true(broken->text().find("still here") != std::string::npos, "broken text: " + broken->text());
        auto empty = make_document("u", "");
        expect_true(!empty->parsed(), "empty body is not parsed");
        expect_true(empty->title().empty() && empty->text().empty() && empty->links().empty(), "empty doc is inert");
        expect_true(empty->looks_dynamic(), "empty page counts as dynamic");
    }

    // Test 7: dynamic-site heuristic
    {
        std::string filler;
        for (int i = 0; i < 20; i++) filler += "Plenty of static server rendered text here. ";
        auto stat = make_document("u", "<html><body><article>" + filler + "</article></body></html>");
        expect_true(!stat->looks_dynamic(), "static page with text is not dynamic");

        auto spa = make_document("u",
            "<html><head><script src=\"/static/react.production.min.js\"></script></head>"
            "<body><div id=\"root\" class=\"app-container\">" + filler + "</div></body></html>");
        expect_true(spa->looks_dynamic(), "framework script plus app root is dynamic");

        auto one = make_document("u",
            "<html><head><script src=\"/js/vue.js\"></script></head><body><section>" + filler + "</section></body></html>");
        expect_true(!one->looks_dynamic(), "a single indicator is not enough");

        auto sparse = make_document("u", "<html><body><div>Loading...</div></body></html>");
        expect_true(sparse->looks_dynamic(), "almost no text counts as dynamic");
    }

    std::cerr << "test_document: ALL PASSED" << std::endl;
    return 0;
}
