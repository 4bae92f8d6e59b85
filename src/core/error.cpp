#include "nonogram_ga/error.hpp"

namespace nonogram_ga {

namespace {
std::string format_dimensions(const std::string& what,
                              size_t expected_rows, size_t expected_cols,
                              size_t actual_rows, size_t actual_cols) {
    return what + ": expected " + std::to_string(expected_rows) + "x"
         + std::to_string(expected_cols) + ", got " + std::to_string(actual_rows)
         + "x" + std::to_string(actual_cols);
}
}  // namespace

MismatchedDimensions::MismatchedDimensions(const std::string& what,
                                           size_t expected_rows, size_t expected_cols,
                                           size_t actual_rows, size_t actual_cols)
    : std::invalid_argument(format_dimensions(what, expected_rows, expected_cols,
                                              actual_rows, actual_cols))
    , expected_rows_(expected_rows)
    , expected_cols_(expected_cols)
    , actual_rows_(actual_rows)
    , actual_cols_(actual_cols) {}

} // namespace nonogram_ga
