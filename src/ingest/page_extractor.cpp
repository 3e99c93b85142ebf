#include "cintel/ingest/page_extractor.h"

#include "cintel/core/normalization.h"

#include <pugixml.hpp>
#include <zip.h>

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace cintel::ingest {

DocumentFormat detect_format_from_path(const std::string_view path) {
  const std::string ext =
      core::normalize_ascii_lower(std::filesystem::path(std::string(path)).extension().string());

  if (ext == ".pdf") {
    return DocumentFormat::kPdf;
  }
  if (ext == ".docx") {
    return DocumentFormat::kDocx;
  }
  if (ext == ".txt" || ext == ".text" || ext == ".md") {
    return DocumentFormat::kText;
  }
  return DocumentFormat::kUnknown;
}

std::string_view format_name(const DocumentFormat format) {
  switch (format) {
    case DocumentFormat::kText:
      return "txt";
    case DocumentFormat::kPdf:
      return "pdf";
    case DocumentFormat::kDocx:
      return "docx";
    case DocumentFormat::kUnknown:
      return "unknown";
  }
  return "unknown";
}

namespace {

// "--- Page 12 ---" with optional surrounding spaces.
bool is_page_marker_line(const std::string_view line) {
  const std::string trimmed = core::trim(line);
  constexpr std::string_view kOpen = "--- Page ";
  constexpr std::string_view kClose = " ---";
  if (trimmed.size() <= kOpen.size() + kClose.size() || !trimmed.starts_with(kOpen) ||
      !trimmed.ends_with(kClose)) {
    return false;
  }
  const std::string_view number =
      std::string_view(trimmed).substr(kOpen.size(), trimmed.size() - kOpen.size() - kClose.size());
  return !number.empty() &&
         std::all_of(number.begin(), number.end(), [](char ch) { return ch >= '0' && ch <= '9'; });
}

std::vector<std::string> split_on_form_feed(const std::string& text) {
  std::vector<std::string> pages;
  std::size_t start = 0;
  while (true) {
    const std::size_t ff = text.find('\f', start);
    if (ff == std::string::npos) {
      pages.push_back(text.substr(start));
      break;
    }
    pages.push_back(text.substr(start, ff - start));
    start = ff + 1;
  }
  // A trailing form feed closes the last page rather than opening an empty one.
  if (pages.size() > 1 && pages.back().empty()) {
    pages.pop_back();
  }
  return pages;
}

std::vector<std::string> split_on_page_markers(const std::string& text) {
  std::vector<std::string> pages;
  std::string current;
  bool seen_marker = false;

  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (is_page_marker_line(line)) {
      if (seen_marker || !core::trim(current).empty()) {
        pages.push_back(core::trim(current));
      }
      current.clear();
      seen_marker = true;
      continue;
    }
    current += line;
    current += '\n';
  }
  pages.push_back(core::trim(current));
  return pages;
}

std::string unescape_pdf_string(const std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out += raw[i];
      continue;
    }
    const char next = raw[++i];
    switch (next) {
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case '\\':
      case '(':
      case ')':
        out += next;
        break;
      default:
        out += '\\';
        out += next;
        break;
    }
  }
  return out;
}

// Concatenates the (...) string operands of a content stream.
std::string text_from_content_stream(const std::string_view content) {
  std::string text;
  std::size_t pos = 0;
  while (pos < content.size()) {
    const std::size_t open = content.find('(', pos);
    if (open == std::string_view::npos) {
      break;
    }
    std::size_t close = open + 1;
    int depth = 1;
    while (close < content.size() && depth > 0) {
      if (content[close] == '\\' && close + 1 < content.size()) {
        close += 2;
        continue;
      }
      if (content[close] == '(') {
        ++depth;
      } else if (content[close] == ')') {
        --depth;
      }
      ++close;
    }
    if (depth != 0) {
      break;
    }
    if (!text.empty() && text.back() != ' ') {
      text += ' ';
    }
    text += unescape_pdf_string(content.substr(open + 1, close - open - 2));
    pos = close;
  }
  return text;
}

struct ZipArchiveCloser {
  void operator()(zip_t* archive) const { zip_discard(archive); }
};
struct ZipFileCloser {
  void operator()(zip_file_t* file) const { zip_fclose(file); }
};

}  // namespace

PageExtractionResult TextPageExtractor::extract(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return PageExtractionResult::err(ExtractionError{"Empty input data"});
  }
  const std::string text(data.begin(), data.end());

  if (text.find('\f') != std::string::npos) {
    return PageExtractionResult::ok(split_on_form_feed(text));
  }

  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (is_page_marker_line(line)) {
      return PageExtractionResult::ok(split_on_page_markers(text));
    }
  }
  return PageExtractionResult::ok(std::vector<std::string>{text});
}

PageExtractionResult PdfPageExtractor::extract(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return PageExtractionResult::err(ExtractionError{"Empty input data"});
  }
  const std::string pdf(data.begin(), data.end());
  if (!pdf.starts_with("%PDF")) {
    return PageExtractionResult::err(ExtractionError{"Invalid PDF: missing %PDF header"});
  }

  std::vector<std::string> pages;
  std::size_t pos = 0;
  while (pos < pdf.size()) {
    std::size_t keyword = pdf.find("stream", pos);
    if (keyword == std::string::npos) {
      break;
    }
    // Skip "endstream" and require the EOL that follows the stream keyword.
    if (keyword >= 3 && pdf.compare(keyword - 3, 3, "end") == 0) {
      pos = keyword + 6;
      continue;
    }
    std::size_t body = keyword + 6;
    if (body < pdf.size() && pdf[body] == '\r') {
      ++body;
    }
    if (body < pdf.size() && pdf[body] == '\n') {
      ++body;
    }
    const std::size_t end = pdf.find("endstream", body);
    if (end == std::string::npos) {
      break;
    }
    const std::string text = core::trim(text_from_content_stream(
        std::string_view(pdf).substr(body, end - body)));
    if (!text.empty()) {
      pages.push_back(text);
    }
    pos = end + 9;
  }

  if (pages.empty()) {
    return PageExtractionResult::err(
        ExtractionError{"No text content found in PDF (compressed or scanned content)"});
  }
  return PageExtractionResult::ok(std::move(pages));
}

PageExtractionResult DocxPageExtractor::extract(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return PageExtractionResult::err(ExtractionError{"Empty input data"});
  }

  zip_error_t error;
  zip_error_init(&error);
  zip_source_t* source = zip_source_buffer_create(data.data(), data.size(), 0, &error);
  if (source == nullptr) {
    zip_error_fini(&error);
    return PageExtractionResult::err(ExtractionError{"Failed to create ZIP source from DOCX data"});
  }
  std::unique_ptr<zip_t, ZipArchiveCloser> archive(
      zip_open_from_source(source, ZIP_RDONLY, &error));
  zip_error_fini(&error);
  if (!archive) {
    zip_source_free(source);
    return PageExtractionResult::err(ExtractionError{"Failed to open DOCX as ZIP archive"});
  }

  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive.get(), "word/document.xml", 0, &stat) != 0) {
    return PageExtractionResult::err(ExtractionError{"word/document.xml missing from DOCX"});
  }
  std::unique_ptr<zip_file_t, ZipFileCloser> file(zip_fopen(archive.get(), "word/document.xml", 0));
  if (!file) {
    return PageExtractionResult::err(ExtractionError{"Failed to open word/document.xml"});
  }
  std::vector<char> xml(stat.size);
  const zip_int64_t read = zip_fread(file.get(), xml.data(), stat.size);
  if (read != static_cast<zip_int64_t>(stat.size)) {
    return PageExtractionResult::err(ExtractionError{"Failed to read word/document.xml"});
  }

  pugi::xml_document doc;
  if (!doc.load_buffer(xml.data(), xml.size())) {
    return PageExtractionResult::err(ExtractionError{"word/document.xml is not well-formed XML"});
  }

  std::vector<std::string> pages(1);
  const pugi::xpath_node_set paragraphs = doc.select_nodes("//w:p");
  for (const pugi::xpath_node& para_node : paragraphs) {
    const pugi::xml_node paragraph = para_node.node();
    if (paragraph.select_node("w:pPr/w:pageBreakBefore") && !pages.back().empty()) {
      pages.emplace_back();
    }

    std::string line;
    pugi::xpath_node_set pieces = paragraph.select_nodes(".//w:t | .//w:tab | .//w:br");
    pieces.sort();
    for (const pugi::xpath_node& piece : pieces) {
      const pugi::xml_node node = piece.node();
      const std::string_view name = node.name();
      if (name == "w:t") {
        line += node.child_value();
      } else if (name == "w:tab") {
        line += '\t';
      } else if (std::string_view(node.attribute("w:type").value()) == "page") {
        pages.back() += line;
        line.clear();
        pages.emplace_back();
      } else {
        line += '\n';
      }
    }
    if (!line.empty()) {
      pages.back() += line;
      pages.back() += '\n';
    }
  }

  if (pages.size() > 1 && pages.back().empty()) {
    pages.pop_back();
  }
  return PageExtractionResult::ok(std::move(pages));
}

std::unique_ptr<IPageExtractor> create_page_extractor(const DocumentFormat format) {
  switch (format) {
    case DocumentFormat::kPdf:
      return std::make_unique<PdfPageExtractor>();
    case DocumentFormat::kDocx:
      return std::make_unique<DocxPageExtractor>();
    case DocumentFormat::kText:
    case DocumentFormat::kUnknown:
      return std::make_unique<TextPageExtractor>();
  }
  return std::make_unique<TextPageExtractor>();
}

}  // namespace cintel::ingest
