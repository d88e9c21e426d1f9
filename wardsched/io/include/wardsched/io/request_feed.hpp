#pragma once

/// @file request_feed.hpp
/// @brief CSV request feed (one row per incoming request).
/// @ingroup io_loaders

#include <wardsched/algo/risk_predictor.hpp>

#include <wardsched/core/request.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wardsched::io {

/// @brief Ordered list of feed rows loaded from a CSV file.
///
/// Row order is submission order. Each row's request id comes from the
/// identifier column; every other column is kept as a string feature.
///
/// @ingroup io_loaders
/// @see load_request_feed
class RequestFeed {
public:
    RequestFeed() = default;
    RequestFeed(std::vector<std::string> columns, std::string id_column,
                std::vector<core::FeedRow> rows);

    [[nodiscard]] std::span<const core::FeedRow> rows() const noexcept { return rows_; }
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::string& id_column() const noexcept { return id_column_; }
    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    /// @brief Restrict the features handed to the model for @p task.
    ///
    /// An empty list (the default) means every feature column.
    void set_feature_columns(algo::ModelTask task, std::vector<std::string> columns);

    /// @brief Features of row @p row projected onto the columns of @p task.
    /// @throws std::out_of_range if @p row is past the end of the feed.
    [[nodiscard]] core::FeatureMap features_for(std::size_t row, algo::ModelTask task) const;

private:
    std::vector<std::string> columns_;
    std::string id_column_;
    std::vector<core::FeedRow> rows_;
    std::map<algo::ModelTask, std::vector<std::string>> task_columns_;
};

/// @brief Load a request feed from a CSV file with a header row.
///
/// The identifier column is @p id_column when the header has it, otherwise
/// the first column. Fields may be double-quoted; a doubled quote inside a
/// quoted field is a literal quote.
///
/// @throws LoaderError if the file cannot be read, has no header, or a row
///         has a different number of fields than the header.
/// @ingroup io_loaders
[[nodiscard]] RequestFeed load_request_feed(const std::filesystem::path& path,
                                            std::string_view id_column = "encounter_id");

/// @brief Load a request feed from CSV text.
/// @see load_request_feed
/// @ingroup io_loaders
[[nodiscard]] RequestFeed load_request_feed_from_string(std::string_view csv,
                                                        std::string_view id_column = "encounter_id");

} // namespace wardsched::io
