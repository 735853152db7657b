#include "intake_core/extractors/spreadsheet_extractor.hpp"

#include <xls.h>
#include <zip.h>

#include <cctype>
#include <cmath>
#include <map>
#include <memory>
#include <pugixml.hpp>

#include "intake_core/extractors/sheet_summary.hpp"

namespace intake_core {

namespace {

struct ZipDiscard {
  void operator()(zip_t* archive) const {
    // Read-only: discard frees without writing anything back
    zip_discard(archive);
  }
};
using ZipArchive = std::unique_ptr<zip_t, ZipDiscard>;

ZipArchive open_workbook(const fs::path& file_path) {
  int zip_error_code = 0;
  zip_t* archive = zip_open(file_path.c_str(), ZIP_RDONLY, &zip_error_code);
  if (!archive) {
    zip_error_t error;
    zip_error_init_with_code(&error, zip_error_code);
    std::string message = "Failed to open workbook container: ";
    message += zip_error_strerror(&error);
    zip_error_fini(&error);
    throw FormatExtractorError(message);
  }
  return ZipArchive(archive);
}

std::optional<std::string> read_entry(zip_t* archive, const std::string& name) {
  zip_stat_t entry_stat;
  zip_stat_init(&entry_stat);
  if (zip_stat(archive, name.c_str(), 0, &entry_stat) != 0 || !(entry_stat.valid & ZIP_STAT_SIZE)) {
    return std::nullopt;
  }

  zip_file_t* entry = zip_fopen(archive, name.c_str(), 0);
  if (!entry) {
    return std::nullopt;
  }
  std::string data(entry_stat.size, '\0');
  const zip_int64_t bytes_read = zip_fread(entry, data.data(), entry_stat.size);
  zip_fclose(entry);
  if (bytes_read < 0 || static_cast<zip_uint64_t>(bytes_read) != entry_stat.size) {
    throw FormatExtractorError("Truncated workbook entry: " + name);
  }
  return data;
}

void parse_xml(pugi::xml_document& doc, const std::string& xml, const std::string& entry_name) {
  pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
  if (!result) {
    throw FormatExtractorError("Malformed " + entry_name + ": " + result.description());
  }
}

std::vector<std::string> load_shared_strings(zip_t* archive) {
  std::vector<std::string> shared_strings;
  const auto xml = read_entry(archive, "xl/sharedStrings.xml");
  if (!xml) {
    return shared_strings;
  }
  pugi::xml_document doc;
  parse_xml(doc, *xml, "xl/sharedStrings.xml");
  for (pugi::xml_node item : doc.document_element().children("si")) {
    std::string text;
    if (pugi::xml_node plain = item.child("t")) {
      text = plain.child_value();
    } else {
      // Rich text: <r><t>...</t></r>
      for (pugi::xml_node run : item.children("r")) {
        text += run.child("t").child_value();
      }
    }
    shared_strings.push_back(std::move(text));
  }
  return shared_strings;
}

struct SheetRef {
  std::string name;
  std::string entry;
};

std::vector<SheetRef> load_sheet_refs(zip_t* archive) {
  const auto workbook_xml = read_entry(archive, "xl/workbook.xml");
  if (!workbook_xml) {
    throw FormatExtractorError("File is not a workbook: xl/workbook.xml missing");
  }

  std::map<std::string, std::string> targets;
  if (const auto rels_xml = read_entry(archive, "xl/_rels/workbook.xml.rels")) {
    pugi::xml_document rels;
    parse_xml(rels, *rels_xml, "xl/_rels/workbook.xml.rels");
    for (pugi::xml_node rel : rels.document_element().children("Relationship")) {
      targets[rel.attribute("Id").as_string()] = rel.attribute("Target").as_string();
    }
  }

  pugi::xml_document workbook;
  parse_xml(workbook, *workbook_xml, "xl/workbook.xml");
  std::vector<SheetRef> refs;
  std::size_t position = 0;
  for (pugi::xml_node sheet : workbook.document_element().child("sheets").children("sheet")) {
    ++position;
    SheetRef ref;
    ref.name = sheet.attribute("name").as_string();
    auto it = targets.find(sheet.attribute("r:id").as_string());
    if (it != targets.end()) {
      const std::string& target = it->second;
      ref.entry = target.rfind('/', 0) == 0 ? target.substr(1) : "xl/" + target;
    } else {
      ref.entry = "xl/worksheets/sheet" + std::to_string(position) + ".xml";
    }
    refs.push_back(std::move(ref));
  }
  return refs;
}

CellKind number_kind(double number) {
  return std::floor(number) == number && std::fabs(number) < 9.2e18 ? CellKind::Integer
                                                                    : CellKind::Float;
}

SheetCell read_cell(pugi::xml_node cell, const std::vector<std::string>& shared_strings) {
  const std::string type = cell.attribute("t").as_string();
  SheetCell out;

  if (type == "inlineStr") {
    out.text = cell.child("is").child("t").child_value();
    out.kind = out.text.empty() ? CellKind::Empty : CellKind::Text;
    return out;
  }

  pugi::xml_node value = cell.child("v");
  if (!value) {
    return out;
  }
  out.text = value.child_value();

  if (type == "s") {
    const auto index = static_cast<std::size_t>(value.text().as_ullong());
    if (index >= shared_strings.size()) {
      throw FormatExtractorError("Shared string index out of range: " + out.text);
    }
    out.text = shared_strings[index];
    out.kind = out.text.empty() ? CellKind::Empty : CellKind::Text;
  } else if (type == "b") {
    out.kind = CellKind::Boolean;
  } else if (type == "str" || type == "e") {
    out.kind = out.text.empty() ? CellKind::Empty : CellKind::Text;
  } else {
    out.kind = number_kind(value.text().as_double());
  }
  return out;
}

SheetRow read_row(pugi::xml_node row, const std::vector<std::string>& shared_strings) {
  SheetRow cells;
  std::size_t next_column = 0;
  for (pugi::xml_node cell : row.children("c")) {
    auto column = SpreadsheetExtractor::column_index_from_reference(cell.attribute("r").as_string());
    const std::size_t index = column.value_or(next_column);
    SheetCell value = read_cell(cell, shared_strings);
    if (value.kind != CellKind::Empty) {
      cells[index] = std::move(value);
    }
    next_column = index + 1;
  }
  return cells;
}

TabularDetails read_sheet(const pugi::xml_document& sheet,
                          const std::vector<std::string>& shared_strings,
                          std::size_t sample_rows) {
  SheetSummary summary(sample_rows);
  std::size_t next_row = 0;
  for (pugi::xml_node row : sheet.document_element().child("sheetData").children("row")) {
    // r is 1-based and may skip rows that hold nothing
    const auto number = static_cast<std::size_t>(row.attribute("r").as_ullong());
    const std::size_t index = number > 0 ? number - 1 : next_row;
    summary.add_row(index, read_row(row, shared_strings));
    next_row = index + 1;
  }
  return summary.finish();
}

FormatDetails extract_xlsx(const fs::path& file_path, std::size_t sample_rows) {
  ZipArchive archive = open_workbook(file_path);
  const std::vector<std::string> shared_strings = load_shared_strings(archive.get());
  const std::vector<SheetRef> refs = load_sheet_refs(archive.get());

  SpreadsheetDetails details;
  details.sheet_count = static_cast<std::int64_t>(refs.size());
  for (const SheetRef& ref : refs) {
    details.sheet_names.push_back(ref.name);
    const auto xml = read_entry(archive.get(), ref.entry);
    if (!xml) {
      throw FormatExtractorError("Worksheet '" + ref.name + "' missing from workbook: " + ref.entry);
    }
    pugi::xml_document sheet;
    parse_xml(sheet, *xml, ref.entry);
    details.sheets[ref.name] = read_sheet(sheet, shared_strings, sample_rows);
  }
  return details;
}

// BIFF record ids libxls leaves in each parsed cell
constexpr unsigned kBiffFormula = 0x0006;
constexpr unsigned kBiffFormulaAlt = 0x0406;
constexpr unsigned kBiffBoolErr = 0x0205;
constexpr unsigned kBiffNumber = 0x0203;
constexpr unsigned kBiffRk = 0x027E;
constexpr unsigned kBiffMulRk = 0x00BD;
constexpr unsigned kBiffLabelSst = 0x00FD;
constexpr unsigned kBiffLabel = 0x0204;
constexpr unsigned kBiffRString = 0x00D6;

struct XlsWorkbookClose {
  void operator()(xls::xlsWorkBook* workbook) const {
    xls::xls_close_WB(workbook);
  }
};
using XlsWorkbook = std::unique_ptr<xls::xlsWorkBook, XlsWorkbookClose>;

struct XlsWorksheetClose {
  void operator()(xls::xlsWorkSheet* worksheet) const {
    xls::xls_close_WS(worksheet);
  }
};
using XlsWorksheet = std::unique_ptr<xls::xlsWorkSheet, XlsWorksheetClose>;

// Formula cells carry l == 0 for a numeric result in d; otherwise str holds
// the cached text, or "bool"/"error" for those result types.
SheetCell read_xls_cell(unsigned id, const char* str, double number, long formula_flag) {
  SheetCell out;
  if (str) {
    out.text = str;
  }
  switch (id) {
    case kBiffNumber:
    case kBiffRk:
    case kBiffMulRk:
      out.kind = number_kind(number);
      break;
    case kBiffLabelSst:
    case kBiffLabel:
    case kBiffRString:
      out.kind = out.text.empty() ? CellKind::Empty : CellKind::Text;
      break;
    case kBiffBoolErr:
      out.kind = out.text == "error" ? CellKind::Empty : CellKind::Boolean;
      break;
    case kBiffFormula:
    case kBiffFormulaAlt:
      if (formula_flag == 0) {
        out.kind = number_kind(number);
      } else if (out.text == "bool") {
        out.kind = CellKind::Boolean;
      } else if (out.text == "error" || out.text.empty()) {
        out.kind = CellKind::Empty;
      } else {
        out.kind = CellKind::Text;
      }
      break;
    default:
      break;
  }
  return out;
}

TabularDetails read_xls_sheet(xls::xlsWorkSheet* worksheet, std::size_t sample_rows) {
  SheetSummary summary(sample_rows);
  if (!worksheet->rows.row) {
    return summary.finish();
  }
  for (std::size_t r = 0; r <= worksheet->rows.lastrow; ++r) {
    const auto& row = worksheet->rows.row[r];
    SheetRow cells;
    for (std::size_t c = 0; c < row.cells.count; ++c) {
      const auto& cell = row.cells.cell[c];
      SheetCell value = read_xls_cell(cell.id, cell.str, cell.d, cell.l);
      if (value.kind != CellKind::Empty) {
        cells[c] = std::move(value);
      }
    }
    summary.add_row(r, std::move(cells));
  }
  return summary.finish();
}

FormatDetails extract_xls(const fs::path& file_path, std::size_t sample_rows) {
  xls::xls_error_t error = xls::LIBXLS_OK;
  XlsWorkbook workbook(xls::xls_open_file(file_path.c_str(), "UTF-8", &error));
  if (!workbook) {
    throw FormatExtractorError(std::string("Failed to open legacy workbook: ") +
                               xls::xls_getError(error));
  }

  SpreadsheetDetails details;
  const auto sheet_count = static_cast<int>(workbook->sheets.count);
  details.sheet_count = sheet_count;
  for (int i = 0; i < sheet_count; ++i) {
    const char* raw_name = workbook->sheets.sheet[i].name;
    std::string name = raw_name ? raw_name : "Sheet" + std::to_string(i + 1);
    details.sheet_names.push_back(name);

    XlsWorksheet worksheet(xls::xls_getWorkSheet(workbook.get(), i));
    if (!worksheet) {
      throw FormatExtractorError("Worksheet '" + name + "' missing from workbook");
    }
    error = xls::xls_parseWorkSheet(worksheet.get());
    if (error != xls::LIBXLS_OK) {
      throw FormatExtractorError("Failed to parse worksheet '" + name + "': " +
                                 xls::xls_getError(error));
    }
    details.sheets[name] = read_xls_sheet(worksheet.get(), sample_rows);
  }
  return details;
}

}  // namespace

SpreadsheetExtractor::SpreadsheetExtractor(ExtractorOptions options) : options_(options) {}

bool SpreadsheetExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".xlsx", ".xls"});
}

std::optional<std::size_t> SpreadsheetExtractor::column_index_from_reference(
    const std::string& reference) {
  // Excel stops at XFD, three letters
  constexpr std::size_t kMaxLetters = 3;
  std::size_t index = 0;
  std::size_t letters = 0;
  for (char c : reference) {
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      break;
    }
    if (++letters > kMaxLetters) {
      return std::nullopt;
    }
    index = index * 26 + static_cast<std::size_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
  }
  if (letters == 0) {
    return std::nullopt;
  }
  return index - 1;
}

FormatDetails SpreadsheetExtractor::extract(const fs::path& file_path) const {
  if (has_extension(file_path, {".xls"})) {
    return extract_xls(file_path, options_.sample_rows);
  }
  return extract_xlsx(file_path, options_.sample_rows);
}

}  // namespace intake_core
