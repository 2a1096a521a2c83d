#include "chunkrelay/storage/xml_document.hpp"
#include "chunkrelay/core/logger.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <regex>
#include <stdexcept>

namespace chunkrelay::storage {

namespace {

std::string strip_namespaces(std::string text) {
    static const std::regex declarations(" xmlns(:\\w*)?=(\"[^\"]*\"|'[^']*')");
    static const std::regex open_prefix("<\\w*:");
    static const std::regex close_prefix("</\\w*:");

    text = std::regex_replace(text, declarations, "");
    text = std::regex_replace(text, close_prefix, "</");
    text = std::regex_replace(text, open_prefix, "<");
    return text;
}

void free_xml_char(xmlChar* p) { xmlFree(p); }

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XPathContextPtr = std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;
using XmlCharPtr = std::unique_ptr<xmlChar, decltype(&free_xml_char)>;

std::string node_text(xmlNodePtr node) {
    XmlCharPtr text(xmlNodeGetContent(node), &free_xml_char);
    return text ? std::string(reinterpret_cast<const char*>(text.get())) : std::string();
}

}

struct XmlDocument::Impl {
    XmlDocPtr doc{nullptr, &xmlFreeDoc};
    XPathContextPtr context{nullptr, &xmlXPathFreeContext};

    XPathObjectPtr eval(const std::string& xpath) const {
        return XPathObjectPtr(
            xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), context.get()),
            &xmlXPathFreeObject);
    }
};

XmlDocument::XmlDocument(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
XmlDocument::~XmlDocument() = default;
XmlDocument::XmlDocument(XmlDocument&&) noexcept = default;
XmlDocument& XmlDocument::operator=(XmlDocument&&) noexcept = default;

std::optional<XmlDocument> XmlDocument::parse(const std::string& text) {
    auto stripped = strip_namespaces(text);

    auto impl = std::make_unique<Impl>();
    impl->doc.reset(xmlReadMemory(stripped.data(), static_cast<int>(stripped.size()), "response.xml",
                                  nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!impl->doc) {
        LOG_DEBUG("Failed to parse XML document ({} bytes)", text.size());
        return std::nullopt;
    }

    impl->context.reset(xmlXPathNewContext(impl->doc.get()));
    if (!impl->context) {
        throw std::runtime_error("xmlXPathNewContext() failed");
    }

    return XmlDocument(std::move(impl));
}

std::optional<std::string> XmlDocument::find(const std::string& xpath) const {
    auto result = impl_->eval(xpath);
    if (!result || xmlXPathNodeSetIsEmpty(result->nodesetval)) {
        return std::nullopt;
    }
    return node_text(result->nodesetval->nodeTab[0]);
}

std::vector<std::string> XmlDocument::find_all(const std::string& xpath) const {
    std::vector<std::string> values;
    auto result = impl_->eval(xpath);
    if (!result || xmlXPathNodeSetIsEmpty(result->nodesetval)) {
        return values;
    }

    for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
        values.push_back(node_text(result->nodesetval->nodeTab[i]));
    }
    return values;
}

XmlWriter::XmlWriter(std::string root_name) : root_name_(std::move(root_name)) {}

XmlWriter& XmlWriter::add_group(const std::string& name, const Fields& fields) {
    children_.push_back(Node{name, "", fields, true});
    return *this;
}

XmlWriter& XmlWriter::add_text(const std::string& name, const std::string& text) {
    children_.push_back(Node{name, text, {}, false});
    return *this;
}

std::string XmlWriter::str() const {
    XmlDocPtr doc(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0")), &xmlFreeDoc);
    if (!doc) {
        throw std::runtime_error("xmlNewDoc() failed");
    }

    auto to_xml = [](const std::string& s) { return reinterpret_cast<const xmlChar*>(s.c_str()); };

    xmlNodePtr root = xmlNewNode(nullptr, to_xml(root_name_));
    xmlDocSetRootElement(doc.get(), root);

    for (const auto& child : children_) {
        if (!child.is_group) {
            xmlNewTextChild(root, nullptr, to_xml(child.name), to_xml(child.text));
            continue;
        }

        xmlNodePtr group = xmlNewChild(root, nullptr, to_xml(child.name), nullptr);
        for (const auto& [name, value] : child.fields) {
            xmlNewTextChild(group, nullptr, to_xml(name), to_xml(value));
        }
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(doc.get(), &buffer, &size, "UTF-8");
    XmlCharPtr owned(buffer, &free_xml_char);
    if (!owned) {
        throw std::runtime_error("xmlDocDumpMemoryEnc() failed");
    }

    return std::string(reinterpret_cast<const char*>(owned.get()), static_cast<size_t>(size));
}

} // namespace chunkrelay::storage
