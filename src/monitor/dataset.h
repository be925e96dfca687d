#pragma once

/// @file dataset.h
/// @brief Fixed-width numeric dataset (rows x features)

#include <cstddef>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace driftwatch::monitor {

/// @brief Ordered sequence of numeric rows sharing one width
///
/// Values are stored row-major. The width is fixed at construction so an
/// empty dataset still knows how many features it has.
class Dataset {
public:
    Dataset() = default;
    explicit Dataset(size_t width) : width_(width) {}

    /// @brief Build a dataset from rows
    /// @param width Feature count; rows of any other width are rejected
    /// @return SchemaMismatchError on a ragged row
    static absl::StatusOr<Dataset> FromRows(
        size_t width, const std::vector<std::vector<double>>& rows);

    /// @brief Append one row
    /// @return SchemaMismatchError if row.size() != Width()
    absl::Status AddRow(const std::vector<double>& row);

    size_t Width() const { return width_; }
    size_t Rows() const { return width_ == 0 ? 0 : values_.size() / width_; }
    bool Empty() const { return Rows() == 0; }

    double At(size_t row, size_t column) const { return values_[row * width_ + column]; }

    /// @brief Copy out one feature column
    /// @return OutOfRange if column >= Width()
    absl::StatusOr<std::vector<double>> Column(size_t column) const;

private:
    size_t width_ = 0;
    std::vector<double> values_;
};

}  // namespace driftwatch::monitor
