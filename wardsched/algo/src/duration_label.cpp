#include <wardsched/algo/duration_label.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>

namespace wardsched::algo {

namespace {

constexpr double HOURS_PER_DAY = 24.0;

// Minimal cursor over the label; every parse step either consumes input
// and succeeds or leaves the label rejected.
class LabelCursor {
public:
    explicit LabelCursor(std::string_view text) : text_(text) {}

    void skip_blanks() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    std::optional<double> number() {
        skip_blanks();
        std::size_t begin = pos_;
        bool seen_dot = false;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' && !seen_dot) {
                seen_dot = true;
                ++pos_;
            } else {
                break;
            }
        }
        if (pos_ == begin) {
            return std::nullopt;
        }
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text_.data() + begin, text_.data() + pos_, value);
        if (ec != std::errc{} || ptr != text_.data() + pos_) {
            return std::nullopt;
        }
        return value;
    }

    bool dash() {
        skip_blanks();
        static constexpr std::string_view en_dash = "\xE2\x80\x93";
        static constexpr std::string_view em_dash = "\xE2\x80\x94";
        auto rest = text_.substr(pos_);
        if (rest.starts_with('-')) {
            pos_ += 1;
            return true;
        }
        if (rest.starts_with(en_dash) || rest.starts_with(em_dash)) {
            pos_ += en_dash.size();
            return true;
        }
        return false;
    }

    std::string word() {
        skip_blanks();
        std::string result;
        while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_]))) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text_[pos_]))));
            ++pos_;
        }
        return result;
    }

    [[nodiscard]] bool at_end() {
        skip_blanks();
        return pos_ == text_.size();
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

} // anonymous namespace

std::optional<double> parse_duration_label(std::string_view label) {
    LabelCursor cursor(label);

    auto low = cursor.number();
    if (!low) {
        return std::nullopt;
    }
    double value = *low;
    if (cursor.dash()) {
        auto high = cursor.number();
        if (!high) {
            return std::nullopt;
        }
        value = (*low + *high) / 2.0;
    }

    std::string unit = cursor.word();
    if (!cursor.at_end()) {
        return std::nullopt;
    }
    if (unit == "day" || unit == "days") {
        return value * HOURS_PER_DAY;
    }
    if (unit == "hour" || unit == "hours") {
        return value;
    }
    return std::nullopt;
}

double duration_label_hours(std::optional<std::string_view> label, double fallback_hours) {
    if (!label) {
        return fallback_hours;
    }
    return parse_duration_label(*label).value_or(fallback_hours);
}

int rounds_for_duration(double hours, double interval_hours) {
    if (interval_hours <= 0.0) {
        return 1;
    }
    double rounds = std::floor(hours / interval_hours);
    if (std::isnan(rounds) || rounds < 1.0) {
        return 1;
    }
    // Compared as double so the cast below always fits an int
    if (rounds >= static_cast<double>(MAX_ROTATION_ROUNDS)) {
        return MAX_ROTATION_ROUNDS;
    }
    return static_cast<int>(rounds);
}

} // namespace wardsched::algo
