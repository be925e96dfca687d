#include "monitor/dataset.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftwatch::monitor {

absl::StatusOr<Dataset> Dataset::FromRows(
    size_t width, const std::vector<std::vector<double>>& rows) {

    Dataset dataset(width);
    dataset.values_.reserve(rows.size() * width);
    for (size_t r = 0; r < rows.size(); ++r) {
        auto status = dataset.AddRow(rows[r]);
        if (!status.ok()) {
            return AnnotateError(status, absl::StrCat("row ", r));
        }
    }
    return dataset;
}

absl::Status Dataset::AddRow(const std::vector<double>& row) {
    if (row.size() != width_) {
        return SchemaMismatchError(absl::StrCat(
            "row has ", row.size(), " values, dataset width is ", width_));
    }
    values_.insert(values_.end(), row.begin(), row.end());
    return absl::OkStatus();
}

absl::StatusOr<std::vector<double>> Dataset::Column(size_t column) const {
    if (column >= width_) {
        return absl::OutOfRangeError(absl::StrCat(
            "column ", column, " out of range for width ", width_));
    }

    const size_t rows = Rows();
    std::vector<double> values;
    values.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        values.push_back(values_[r * width_ + column]);
    }
    return values;
}

}  // namespace driftwatch::monitor
