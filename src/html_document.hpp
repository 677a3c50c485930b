#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct lxb_dom_element;
struct HtmlEngine;

// An element of a parsed HtmlDocument. Keeps the document alive.
class HtmlElement {
public:
    std::vector<HtmlElement> select(const std::string& css) const;
    std::optional<HtmlElement> select_first(const std::string& css) const;

    std::optional<std::string> attr(const std::string& name) const;

    // Text content with whitespace collapsed and trimmed.
    std::string text() const;

private:
    friend class HtmlDocument;
    HtmlElement(lxb_dom_element* element, std::shared_ptr<HtmlEngine> engine)
        : element_(element), engine_(std::move(engine)) {}

    lxb_dom_element* element_;
    std::shared_ptr<HtmlEngine> engine_;
};

// lexbor document plus the CSS parser and selector engine used to query it.
class HtmlDocument {
public:
    // Throws HtmlParseError when lexbor cannot build the document.
    explicit HtmlDocument(const std::string& html);

    std::vector<HtmlElement> select(const std::string& css) const;
    std::optional<HtmlElement> select_first(const std::string& css) const;

    // Text of the first match, nullopt when nothing matches.
    std::optional<std::string> select_text(const std::string& css) const;

    bool contains(const std::string& css) const { return select_first(css).has_value(); }

private:
    static std::vector<HtmlElement> wrap(const std::shared_ptr<HtmlEngine>& engine,
                                         const std::vector<lxb_dom_element*>& elements);
    friend class HtmlElement;

    std::shared_ptr<HtmlEngine> engine_;
};
