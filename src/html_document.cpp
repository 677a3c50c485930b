#include "html_document.hpp"

#include "errors.hpp"
#include "text_utils.hpp"

#include <lexbor/css/css.h>
#include <lexbor/html/html.h>
#include <lexbor/selectors/selectors.h>

struct HtmlEngine {
    lxb_html_document_t* document = nullptr;
    lxb_css_parser_t* parser = nullptr;
    lxb_selectors_t* selectors = nullptr;

    HtmlEngine() = default;
    HtmlEngine(const HtmlEngine&) = delete;
    HtmlEngine& operator=(const HtmlEngine&) = delete;

    ~HtmlEngine() {
        if (selectors) lxb_selectors_destroy(selectors, true);
        if (parser) lxb_css_parser_destroy(parser, true);
        if (document) lxb_html_document_destroy(document);
    }

    std::vector<lxb_dom_element_t*> find(lxb_dom_node_t* root, const std::string& css) {
        lxb_css_selector_list_t* list =
                lxb_css_selectors_parse(parser, reinterpret_cast<const lxb_char_t*>(css.data()), css.size());
        if (list == nullptr || parser->status != LXB_STATUS_OK) {
            if (list) lxb_css_selector_list_destroy_memory(list);
            throw HtmlParseError("Failed to parse css selector: " + css);
        }

        std::vector<lxb_dom_element_t*> found;
        lxb_status_t status = lxb_selectors_find(
                selectors, root, list,
                [](lxb_dom_node_t* node, auto, void* ctx) -> lxb_status_t {
                    auto* out = static_cast<std::vector<lxb_dom_element_t*>*>(ctx);
                    if (node->type == LXB_DOM_NODE_TYPE_ELEMENT) {
                        out->push_back(lxb_dom_interface_element(node));
                    }
                    return LXB_STATUS_OK;
                },
                &found);
        lxb_css_selector_list_destroy_memory(list);
        if (status != LXB_STATUS_OK) {
            throw HtmlParseError("Failed to match css selector: " + css);
        }
        return found;
    }
};

HtmlDocument::HtmlDocument(const std::string& html) : engine_(std::make_shared<HtmlEngine>()) {
    engine_->document = lxb_html_document_create();
    if (engine_->document == nullptr) throw HtmlParseError("Failed to create html document");

    lxb_status_t status = lxb_html_document_parse(
            engine_->document, reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
    if (status != LXB_STATUS_OK) throw HtmlParseError("Failed to parse html document");

    engine_->parser = lxb_css_parser_create();
    if (engine_->parser == nullptr || lxb_css_parser_init(engine_->parser, nullptr) != LXB_STATUS_OK) {
        throw HtmlParseError("Failed to init css parser");
    }

    engine_->selectors = lxb_selectors_create();
    if (engine_->selectors == nullptr || lxb_selectors_init(engine_->selectors) != LXB_STATUS_OK) {
        throw HtmlParseError("Failed to init selectors");
    }
}

std::vector<HtmlElement> HtmlDocument::wrap(const std::shared_ptr<HtmlEngine>& engine,
                                            const std::vector<lxb_dom_element*>& elements) {
    std::vector<HtmlElement> out;
    out.reserve(elements.size());
    for (auto* el : elements) out.push_back(HtmlElement(el, engine));
    return out;
}

std::vector<HtmlElement> HtmlDocument::select(const std::string& css) const {
    auto* root = lxb_dom_interface_node(engine_->document);
    return wrap(engine_, engine_->find(root, css));
}

std::optional<HtmlElement> HtmlDocument::select_first(const std::string& css) const {
    auto all = select(css);
    if (all.empty()) return std::nullopt;
    return all.front();
}

std::optional<std::string> HtmlDocument::select_text(const std::string& css) const {
    auto el = select_first(css);
    if (!el) return std::nullopt;
    return el->text();
}

std::vector<HtmlElement> HtmlElement::select(const std::string& css) const {
    return HtmlDocument::wrap(engine_, engine_->find(lxb_dom_interface_node(element_), css));
}

std::optional<HtmlElement> HtmlElement::select_first(const std::string& css) const {
    auto all = select(css);
    if (all.empty()) return std::nullopt;
    return all.front();
}

std::optional<std::string> HtmlElement::attr(const std::string& name) const {
    size_t valueSize = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(
            element_, reinterpret_cast<const lxb_char_t*>(name.data()), name.size(), &valueSize);
    if (value == nullptr) {
        // valueless attributes (<td nowrap>) report a null value
        bool present = lxb_dom_element_has_attribute(
                element_, reinterpret_cast<const lxb_char_t*>(name.data()), name.size());
        if (!present) return std::nullopt;
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(value), valueSize);
}

std::string HtmlElement::text() const {
    lxb_dom_node_t* node = lxb_dom_interface_node(element_);
    size_t valueSize = 0;
    lxb_char_t* value = lxb_dom_node_text_content(node, &valueSize);
    if (value == nullptr) return {};
    std::string raw(reinterpret_cast<const char*>(value), valueSize);
    lxb_dom_document_destroy_text(node->owner_document, value);
    return textutil::normalize_whitespace(raw);
}
