#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "intake_core/extractors/dtype_inference.hpp"
#include "intake_core/types/metadata_record.hpp"

namespace intake_core {

struct SheetCell {
  CellKind kind = CellKind::Empty;
  std::string text;
};

// Column index -> non-empty cell
using SheetRow = std::map<std::size_t, SheetCell>;

// Folds the rows of one worksheet into its tabular summary. Row 0 is the
// header; every row between the header and the last non-empty row is a data
// row, blank ones included, so trailing blank rows are the only ones dropped.
class SheetSummary {
 public:
  explicit SheetSummary(std::size_t sample_rows);

  // row_index is 0-based. Rows may skip indexes; a skipped row is blank.
  void add_row(std::size_t row_index, SheetRow cells);

  TabularDetails finish() const;

 private:
  std::size_t sample_rows_;
  bool has_content_ = false;
  std::size_t last_row_ = 0;
  std::size_t width_ = 0;
  SheetRow header_;
  std::map<std::size_t, SheetRow> sample_;
};

}  // namespace intake_core
