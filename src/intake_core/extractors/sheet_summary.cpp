#include "intake_core/extractors/sheet_summary.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace intake_core {

SheetSummary::SheetSummary(std::size_t sample_rows) : sample_rows_(sample_rows) {}

void SheetSummary::add_row(std::size_t row_index, SheetRow cells) {
  if (cells.empty()) {
    return;
  }
  has_content_ = true;
  last_row_ = std::max(last_row_, row_index);
  width_ = std::max(width_, cells.rbegin()->first + 1);

  if (row_index == 0) {
    header_ = std::move(cells);
  } else if (row_index <= sample_rows_) {
    sample_[row_index] = std::move(cells);
  }
}

TabularDetails SheetSummary::finish() const {
  TabularDetails details;
  if (!has_content_) {
    return details;
  }

  details.row_count = static_cast<std::int64_t>(last_row_);
  details.column_count = static_cast<std::int64_t>(width_);
  const std::size_t sampled = std::min(sample_rows_, last_row_);

  for (std::size_t col = 0; col < width_; ++col) {
    auto it = header_.find(col);
    std::string name = it != header_.end() ? it->second.text : "Unnamed: " + std::to_string(col);

    std::vector<CellKind> kinds;
    kinds.reserve(sampled);
    for (std::size_t row = 1; row <= sampled; ++row) {
      CellKind kind = CellKind::Empty;
      auto cells = sample_.find(row);
      if (cells != sample_.end()) {
        auto cell = cells->second.find(col);
        if (cell != cells->second.end()) {
          kind = cell->second.kind;
        }
      }
      kinds.push_back(kind);
    }
    details.column_types.emplace_back(name, infer_dtype(kinds));
    details.column_names.push_back(std::move(name));
  }
  return details;
}

}  // namespace intake_core
