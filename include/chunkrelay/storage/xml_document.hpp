#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkrelay::storage {

// Read-only view of an XML response, queried with XPath. Namespace
// declarations are stripped on parse so expressions can use bare names.
class XmlDocument {
public:
    ~XmlDocument();

    XmlDocument(XmlDocument&&) noexcept;
    XmlDocument& operator=(XmlDocument&&) noexcept;

    static std::optional<XmlDocument> parse(const std::string& text);

    // Text of the first node matching xpath.
    std::optional<std::string> find(const std::string& xpath) const;
    std::vector<std::string> find_all(const std::string& xpath) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    explicit XmlDocument(std::unique_ptr<Impl> impl);
};

// Builds small request documents: a root holding repeated groups of text elements.
class XmlWriter {
public:
    explicit XmlWriter(std::string root_name);

    using Fields = std::vector<std::pair<std::string, std::string>>;

    XmlWriter& add_group(const std::string& name, const Fields& fields);
    XmlWriter& add_text(const std::string& name, const std::string& text);

    std::string str() const;

private:
    struct Node {
        std::string name;
        std::string text;
        Fields fields;
        bool is_group;
    };

    std::string root_name_;
    std::vector<Node> children_;
};

} // namespace chunkrelay::storage
