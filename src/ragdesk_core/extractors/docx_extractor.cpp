#include "ragdesk_core/extractors/docx_extractor.hpp"

#include <utf8.h>
#include <zip_file.hpp>

#include <cstdint>
#include <iterator>

namespace ragdesk_core {

namespace {

constexpr const char* kDocumentPart = "word/document.xml";

std::string decode_entities(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  size_t pos = 0;
  while (pos < raw.size()) {
    if (raw[pos] != '&') {
      out += raw[pos++];
      continue;
    }
    const size_t semi = raw.find(';', pos);
    if (semi == std::string::npos) {
      out += raw.substr(pos);
      break;
    }
    const std::string entity = raw.substr(pos + 1, semi - pos - 1);
    if (entity == "amp") {
      out += '&';
    } else if (entity == "lt") {
      out += '<';
    } else if (entity == "gt") {
      out += '>';
    } else if (entity == "quot") {
      out += '"';
    } else if (entity == "apos") {
      out += '\'';
    } else if (entity.size() > 1 && entity[0] == '#') {
      try {
        const bool hex = entity[1] == 'x' || entity[1] == 'X';
        const unsigned long cp = std::stoul(entity.substr(hex ? 2 : 1), nullptr, hex ? 16 : 10);
        utf8::append(static_cast<uint32_t>(cp), std::back_inserter(out));
      } catch (const std::exception&) {
        out += raw.substr(pos, semi - pos + 1);
      }
    } else {
      out += raw.substr(pos, semi - pos + 1);
    }
    pos = semi + 1;
  }
  return out;
}

}  // namespace

bool DocxExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, ".docx");
}

std::string DocxExtractor::extract_text(const fs::path& file_path) const {
  std::string xml;
  try {
    miniz_cpp::zip_file archive(file_path.string());
    if (!archive.has_file(kDocumentPart)) {
      throw ContentExtractorError("Not a Word document (missing " + std::string(kDocumentPart) +
                                  "): " + file_path.string());
    }
    xml = archive.read(kDocumentPart);
  } catch (const ContentExtractorError&) {
    throw;
  } catch (const std::exception& e) {
    throw ContentExtractorError("Failed to read Word document " + file_path.string() + ": " +
                                e.what());
  }
  return document_xml_to_text(xml);
}

std::string DocxExtractor::document_xml_to_text(const std::string& xml) {
  std::string text;
  bool first_paragraph = true;
  size_t pos = 0;

  while ((pos = xml.find('<', pos)) != std::string::npos) {
    const size_t close = xml.find('>', pos);
    if (close == std::string::npos) {
      break;
    }

    const std::string tag = xml.substr(pos + 1, close - pos - 1);
    const bool closing = !tag.empty() && tag.front() == '/';
    const bool self_closing = !tag.empty() && tag.back() == '/';
    const size_t name_end = tag.find_first_of(" /\t\r\n", closing ? 1 : 0);
    const std::string name = tag.substr(closing ? 1 : 0, name_end == std::string::npos
                                                             ? std::string::npos
                                                             : name_end - (closing ? 1 : 0));

    if (!closing && name == "w:p") {
      if (!first_paragraph) {
        text += '\n';
      }
      first_paragraph = false;
    } else if (!closing && !self_closing && name == "w:t") {
      const size_t end = xml.find("</w:t>", close);
      if (end == std::string::npos) {
        break;
      }
      text += decode_entities(xml.substr(close + 1, end - close - 1));
      pos = end + 6;
      continue;
    } else if (!closing && name == "w:tab") {
      text += '\t';
    } else if (!closing && (name == "w:br" || name == "w:cr")) {
      text += '\n';
    }
    pos = close + 1;
  }
  return text;
}

}  // namespace ragdesk_core
