#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "ragdesk_core/extractors/docx_extractor.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdesk_core {

namespace {

const char* kBodyXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:body>)"
    R"(<w:p><w:pPr><w:pStyle w:val="Heading1"/></w:pPr><w:r><w:t>Week 2</w:t></w:r></w:p>)"
    R"(<w:p><w:r><w:t xml:space="preserve">Attendance is </w:t></w:r>)"
    R"(<w:r><w:rPr><w:b/></w:rPr><w:t>mandatory</w:t></w:r><w:r><w:t>.</w:t></w:r></w:p>)"
    R"(<w:p><w:r><w:t>Q&amp;A</w:t><w:tab/><w:t>&lt;room 4&gt;</w:t><w:br/><w:t>caf&#233;</w:t></w:r></w:p>)"
    R"(</w:body></w:document>)";

}  // namespace

class DocxExtractorTest : public ragdesk_tests::TempDirTestBase {
 protected:
  std::filesystem::path create_docx(const std::string& filename, const std::string& document_xml) {
    return ragdesk_tests::TestUtilities::write_stored_zip(
        temp_dir_ / filename,
        {{"[Content_Types].xml",
          R"(<?xml version="1.0"?><Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types"/>)"},
         {"word/document.xml", document_xml}});
  }

  DocxExtractor extractor_;
};

TEST_F(DocxExtractorTest, CanHandle_DocxFiles) {
  EXPECT_TRUE(extractor_.can_handle("handbook.docx"));
  EXPECT_TRUE(extractor_.can_handle("HANDBOOK.DOCX"));
  EXPECT_FALSE(extractor_.can_handle("handbook.doc"));
  EXPECT_EQ(extractor_.get_file_type(), FileType::Word);
}

TEST(DocxXmlTest, ParagraphsBecomeLines) {
  EXPECT_EQ(DocxExtractor::document_xml_to_text(kBodyXml),
            "Week 2\nAttendance is mandatory.\nQ&A\t<room 4>\ncafé");
}

TEST(DocxXmlTest, EmptyBodyHasNoText) {
  EXPECT_EQ(DocxExtractor::document_xml_to_text("<w:document><w:body/></w:document>"), "");
}

TEST(DocxXmlTest, UnknownEntitiesAreKept) {
  EXPECT_EQ(DocxExtractor::document_xml_to_text("<w:p><w:r><w:t>a &nbsp; b</w:t></w:r></w:p>"),
            "a &nbsp; b");
}

TEST_F(DocxExtractorTest, ExtractText_ReadsDocumentPart) {
  auto path = create_docx("week2.docx", kBodyXml);

  EXPECT_EQ(extractor_.extract_text(path), "Week 2\nAttendance is mandatory.\nQ&A\t<room 4>\ncafé");
}

TEST_F(DocxExtractorTest, ExtractText_ArchiveWithoutDocumentPartThrows) {
  auto path = ragdesk_tests::TestUtilities::write_stored_zip(
      temp_dir_ / "not_word.docx", {{"content.xml", "<office:document/>"}});

  EXPECT_THROW({ (void)extractor_.extract_text(path); }, ContentExtractorError);
}

TEST_F(DocxExtractorTest, ExtractText_NotAZipThrows) {
  auto path = create_test_file("corrupt.docx", "this is not a zip archive");

  EXPECT_THROW({ (void)extractor_.extract_text(path); }, ContentExtractorError);
}

}  // namespace ragdesk_core
