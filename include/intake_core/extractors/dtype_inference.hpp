#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace intake_core {

enum class CellKind { Empty, Integer, Float, Boolean, Text };

// Classifies a raw delimited-text cell the way a dataframe reader would
CellKind classify_text_cell(std::string_view cell);

// Collapses the sampled cells of one column to a dtype name:
// int64, float64, bool or object. Missing values upcast integers to float64
// and booleans to object; an all-missing column is float64.
std::string infer_dtype(const std::vector<CellKind>& cells);

}  // namespace intake_core
