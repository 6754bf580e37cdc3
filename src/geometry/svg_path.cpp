#include "svg_path.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace pulsetrace {
namespace geometry {

namespace {

bool is_separator(char ch) {
    return ch == ',' || std::isspace(static_cast<unsigned char>(ch));
}

bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

class SvgPathParser {
public:
    SvgPathParser(std::string_view data, std::vector<std::string>& warnings)
        : data_(data), warnings_(warnings) {}

    std::optional<Path> parse() {
        while (true) {
            skip_separators();
            if (pos_ >= data_.size()) {
                break;
            }

            const char ch = data_[pos_];
            if (!std::isalpha(static_cast<unsigned char>(ch))) {
                warn("expected a path command");
                return std::nullopt;
            }
            ++pos_;
            if (!apply_command(ch)) {
                return std::nullopt;
            }
        }
        return builder_.build();
    }

private:
    bool apply_command(char ch) {
        const bool relative = std::islower(static_cast<unsigned char>(ch)) != 0;
        char command = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

        switch (command) {
        case 'Z':
            builder_.close();
            current_ = subpath_start_;
            has_cubic_control_ = false;
            return true;
        case 'M':
        case 'L':
        case 'H':
        case 'V':
        case 'C':
        case 'S':
            break;
        case 'Q':
        case 'T':
        case 'A': {
            std::ostringstream oss;
            oss << "unsupported path command '" << ch << "'";
            warn(oss.str());
            return false;
        }
        default: {
            std::ostringstream oss;
            oss << "unknown path command '" << ch << "'";
            warn(oss.str());
            return false;
        }
        }

        do {
            if (!apply_arguments(command, relative)) {
                return false;
            }
            // Coordinate pairs after a MoveTo are implicit LineTos.
            if (command == 'M') {
                command = 'L';
            }
            skip_separators();
        } while (at_number_start());
        return true;
    }

    bool apply_arguments(char command, bool relative) {
        switch (command) {
        case 'M': {
            Point point;
            if (!read_point(point, relative)) {
                return false;
            }
            builder_.move_to(point);
            current_ = point;
            subpath_start_ = point;
            has_cubic_control_ = false;
            return true;
        }
        case 'L': {
            Point point;
            if (!read_point(point, relative)) {
                return false;
            }
            builder_.line_to(point);
            current_ = point;
            has_cubic_control_ = false;
            return true;
        }
        case 'H': {
            float x = 0.0f;
            if (!read_number(x)) {
                return false;
            }
            current_.x = relative ? current_.x + x : x;
            builder_.line_to(current_);
            has_cubic_control_ = false;
            return true;
        }
        case 'V': {
            float y = 0.0f;
            if (!read_number(y)) {
                return false;
            }
            current_.y = relative ? current_.y + y : y;
            builder_.line_to(current_);
            has_cubic_control_ = false;
            return true;
        }
        case 'C': {
            Point control_a;
            Point control_b;
            Point end;
            if (!read_point(control_a, relative) ||
                !read_point(control_b, relative) ||
                !read_point(end, relative)) {
                return false;
            }
            emit_cubic(end, control_a, control_b);
            return true;
        }
        case 'S': {
            Point control_b;
            Point end;
            if (!read_point(control_b, relative) || !read_point(end, relative)) {
                return false;
            }
            const Point control_a = has_cubic_control_
                                        ? Point{2.0f * current_.x - last_control_.x,
                                                2.0f * current_.y - last_control_.y}
                                        : current_;
            emit_cubic(end, control_a, control_b);
            return true;
        }
        default:
            return false;
        }
    }

    void emit_cubic(const Point& end, const Point& control_a, const Point& control_b) {
        builder_.curve_to(end, control_a, control_b);
        last_control_ = control_b;
        has_cubic_control_ = true;
        current_ = end;
    }

    // Relative coordinates are offsets from the pen position at the start of
    // the command, so current_ must not move until the whole set is read.
    bool read_point(Point& out, bool relative) {
        float x = 0.0f;
        float y = 0.0f;
        if (!read_number(x) || !read_number(y)) {
            return false;
        }
        out = relative ? Point{current_.x + x, current_.y + y} : Point{x, y};
        return true;
    }

    bool read_number(float& out) {
        skip_separators();
        const std::size_t start = pos_;
        std::size_t cursor = pos_;

        if (cursor < data_.size() && (data_[cursor] == '+' || data_[cursor] == '-')) {
            ++cursor;
        }
        std::size_t digits = 0;
        while (cursor < data_.size() && is_digit(data_[cursor])) {
            ++cursor;
            ++digits;
        }
        if (cursor < data_.size() && data_[cursor] == '.') {
            ++cursor;
            while (cursor < data_.size() && is_digit(data_[cursor])) {
                ++cursor;
                ++digits;
            }
        }
        if (digits == 0) {
            warn("expected a number");
            return false;
        }
        if (cursor < data_.size() && (data_[cursor] == 'e' || data_[cursor] == 'E')) {
            std::size_t exponent = cursor + 1;
            if (exponent < data_.size() && (data_[exponent] == '+' || data_[exponent] == '-')) {
                ++exponent;
            }
            if (exponent < data_.size() && is_digit(data_[exponent])) {
                while (exponent < data_.size() && is_digit(data_[exponent])) {
                    ++exponent;
                }
                cursor = exponent;
            }
        }

        const std::string text(data_.substr(start, cursor - start));
        char* end = nullptr;
        const float value = std::strtof(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(value)) {
            warn("malformed number '" + text + "'");
            return false;
        }

        out = value;
        pos_ = cursor;
        return true;
    }

    void skip_separators() {
        while (pos_ < data_.size() && is_separator(data_[pos_])) {
            ++pos_;
        }
    }

    bool at_number_start() const {
        if (pos_ >= data_.size()) {
            return false;
        }
        const char ch = data_[pos_];
        return is_digit(ch) || ch == '+' || ch == '-' || ch == '.';
    }

    void warn(const std::string& message) {
        std::ostringstream oss;
        oss << "SVG path: " << message << " at offset " << pos_;
        warnings_.push_back(oss.str());
    }

    std::string_view data_;
    std::vector<std::string>& warnings_;
    std::size_t pos_ = 0;

    PathBuilder builder_;
    Point current_{};
    Point subpath_start_{};
    Point last_control_{};
    bool has_cubic_control_ = false;
};

} // namespace

std::optional<Path> parse_svg_path(std::string_view data, std::vector<std::string>& warnings) {
    SvgPathParser parser(data, warnings);
    return parser.parse();
}

} // namespace geometry
} // namespace pulsetrace
