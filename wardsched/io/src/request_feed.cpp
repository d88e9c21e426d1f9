#include <wardsched/io/request_feed.hpp>
#include <wardsched/io/error.hpp>

#include <wardsched/algo/admission_pipeline.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wardsched::io {

namespace {

// Splits CSV text into records. Quoted fields may span lines.
class CsvReader {
public:
    explicit CsvReader(std::string_view text)
        : text_(text) {}

    [[nodiscard]] bool done() const noexcept { return pos_ >= text_.size(); }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

    std::vector<std::string> next_record() {
        std::vector<std::string> fields;
        std::string field;
        bool quoted = false;
        std::size_t start_line = line_;

        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (quoted) {
                if (c == '"') {
                    if (pos_ < text_.size() && text_[pos_] == '"') {
                        field += '"';
                        ++pos_;
                    } else {
                        quoted = false;
                    }
                } else {
                    if (c == '\n') {
                        ++line_;
                    }
                    field += c;
                }
                continue;
            }
            if (c == '"') {
                quoted = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
            } else if (c == '\n') {
                ++line_;
                break;
            } else if (c != '\r') {
                field += c;
            }
        }
        if (quoted) {
            throw LoaderError("unterminated quoted field", "line " + std::to_string(start_line));
        }
        fields.push_back(std::move(field));
        return fields;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
    std::size_t line_{1};
};

bool blank(const std::vector<std::string>& record) {
    return record.size() == 1 && record.front().empty();
}

} // anonymous namespace

RequestFeed::RequestFeed(std::vector<std::string> columns, std::string id_column,
                         std::vector<core::FeedRow> rows)
    : columns_(std::move(columns))
    , id_column_(std::move(id_column))
    , rows_(std::move(rows)) {}

void RequestFeed::set_feature_columns(algo::ModelTask task, std::vector<std::string> columns) {
    task_columns_[task] = std::move(columns);
}

core::FeatureMap RequestFeed::features_for(std::size_t row, algo::ModelTask task) const {
    if (row >= rows_.size()) {
        throw std::out_of_range("feed row " + std::to_string(row) + " out of range");
    }
    auto it = task_columns_.find(task);
    if (it == task_columns_.end()) {
        return rows_[row].features;
    }
    return algo::project_features(rows_[row].features, it->second);
}

RequestFeed load_request_feed(const std::filesystem::path& path, std::string_view id_column) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_request_feed_from_string(oss.str(), id_column);
}

RequestFeed load_request_feed_from_string(std::string_view csv, std::string_view id_column) {
    CsvReader reader(csv);
    if (reader.done()) {
        throw LoaderError("missing header row", "feed");
    }

    auto header = reader.next_record();
    if (blank(header)) {
        throw LoaderError("missing header row", "feed");
    }

    auto id_it = std::find(header.begin(), header.end(), id_column);
    std::size_t id_index = id_it == header.end()
        ? 0
        : static_cast<std::size_t>(id_it - header.begin());

    std::vector<core::FeedRow> rows;
    while (!reader.done()) {
        std::size_t line = reader.line();
        auto record = reader.next_record();
        if (blank(record)) {
            continue;
        }
        if (record.size() != header.size()) {
            throw LoaderError("expected " + std::to_string(header.size()) + " fields, found " +
                                  std::to_string(record.size()),
                              "line " + std::to_string(line));
        }
        core::FeedRow row;
        row.request_id = record[id_index];
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (i != id_index) {
                row.features.emplace(header[i], std::move(record[i]));
            }
        }
        rows.push_back(std::move(row));
    }

    std::string id_name = header[id_index];
    return RequestFeed(std::move(header), std::move(id_name), std::move(rows));
}

} // namespace wardsched::io
