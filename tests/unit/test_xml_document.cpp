#include <gtest/gtest.h>
#include "chunkrelay/storage/xml_document.hpp"

using namespace chunkrelay::storage;

TEST(XmlDocumentTest, FindsTextByPath) {
    auto doc = XmlDocument::parse(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<InitiateMultipartUploadResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<Bucket>backups</Bucket><Key>a.csv</Key><UploadId>VXBsb2FkIElE</UploadId>"
        "</InitiateMultipartUploadResult>");
    ASSERT_TRUE(doc.has_value());

    EXPECT_EQ(doc->find("/InitiateMultipartUploadResult/UploadId"), "VXBsb2FkIElE");
    EXPECT_EQ(doc->find("//Bucket"), "backups");
    EXPECT_FALSE(doc->find("/InitiateMultipartUploadResult/Missing").has_value());
}

TEST(XmlDocumentTest, PrefixedNamespacesAreStripped) {
    auto doc = XmlDocument::parse(
        "<s3:Error xmlns:s3='urn:example'><s3:Code>SlowDown</s3:Code></s3:Error>");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->find("/Error/Code"), "SlowDown");
}

TEST(XmlDocumentTest, FindAllKeepsDocumentOrder) {
    auto doc = XmlDocument::parse(
        "<ListPartsResult><Part><PartNumber>1</PartNumber></Part>"
        "<Part><PartNumber>2</PartNumber></Part><Part><PartNumber>3</PartNumber></Part></ListPartsResult>");
    ASSERT_TRUE(doc.has_value());

    EXPECT_EQ(doc->find_all("/ListPartsResult/Part/PartNumber"),
              (std::vector<std::string>{"1", "2", "3"}));
    EXPECT_TRUE(doc->find_all("//Nothing").empty());
}

TEST(XmlDocumentTest, MalformedInput) {
    EXPECT_FALSE(XmlDocument::parse("").has_value());
    EXPECT_FALSE(XmlDocument::parse("<open><unclosed></open>").has_value());
    EXPECT_FALSE(XmlDocument::parse("{\"json\":true}").has_value());
}

TEST(XmlDocumentTest, MovedDocumentStaysUsable) {
    auto doc = XmlDocument::parse("<a><b>value</b></a>");
    ASSERT_TRUE(doc.has_value());

    XmlDocument moved = std::move(*doc);
    EXPECT_EQ(moved.find("/a/b"), "value");
}

TEST(XmlWriterTest, GroupsAndTextEscape) {
    XmlWriter writer("CompleteMultipartUpload");
    writer.add_group("Part", {{"PartNumber", "1"}, {"ETag", "\"abc\""}})
          .add_group("Part", {{"PartNumber", "2"}, {"ETag", "<&>"}});

    auto text = writer.str();
    EXPECT_NE(text.find("<?xml"), std::string::npos);

    auto doc = XmlDocument::parse(text);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->find_all("/CompleteMultipartUpload/Part/ETag"),
              (std::vector<std::string>{"\"abc\"", "<&>"}));
}

TEST(XmlWriterTest, TextChildren) {
    auto text = XmlWriter("BlockList").add_text("Latest", "AAAA").add_text("Latest", "BBBB").str();

    auto doc = XmlDocument::parse(text);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->find_all("/BlockList/Latest"), (std::vector<std::string>{"AAAA", "BBBB"}));
}
