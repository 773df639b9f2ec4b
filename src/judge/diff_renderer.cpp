#include "judge/diff_renderer.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

#include "utils/common.hpp"

namespace verdict::judge {
namespace {

constexpr std::size_t kColumns = 3;
// "| " + " | " + " | " + " |"
constexpr std::size_t kBorderWidth = 10;

using Row = std::array<std::string, kColumns>;

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::size_t DisplayLength(const std::string& text) {
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), [](char c) { return !IsContinuationByte(c); }));
}

// Splits `text` into pieces of at most `width` code points.
std::vector<std::string> Wrap(const std::string& text, std::size_t width) {
    std::vector<std::string> pieces;
    if (text.empty()) {
        pieces.emplace_back();
        return pieces;
    }
    std::string current;
    std::size_t length = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!IsContinuationByte(text[i])) {
            if (length == width) {
                pieces.push_back(std::move(current));
                current.clear();
                length = 0;
            }
            ++length;
        }
        current.push_back(text[i]);
    }
    pieces.push_back(std::move(current));
    return pieces;
}

std::array<std::size_t, kColumns> ColumnWidths(const std::vector<Row>& rows, std::size_t width) {
    std::array<std::size_t, kColumns> widths{};
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < kColumns; ++c) {
            widths[c] = std::max(widths[c], DisplayLength(row[c]));
        }
    }
    const auto natural = widths[0] + widths[1] + widths[2] + kBorderWidth;
    if (natural <= width || width <= kBorderWidth + widths[0] + 2) {
        return widths;
    }

    // Only the text columns shrink; one that needs less than half leaves the rest to the other.
    const auto available = width - kBorderWidth - widths[0];
    const auto half = available / 2;
    if (widths[1] <= half) {
        widths[2] = available - widths[1];
    } else if (widths[2] <= half) {
        widths[1] = available - widths[2];
    } else {
        widths[1] = half;
        widths[2] = available - half;
    }
    return widths;
}

void AppendSeparator(std::ostringstream& out, const std::array<std::size_t, kColumns>& widths, char fill) {
    for (const auto w : widths) {
        out << '+' << std::string(w + 2, fill);
    }
    out << "+\n";
}

void AppendRow(std::ostringstream& out, const Row& row, const std::array<std::size_t, kColumns>& widths) {
    std::array<std::vector<std::string>, kColumns> cells;
    std::size_t height = 0;
    for (std::size_t c = 0; c < kColumns; ++c) {
        cells[c] = Wrap(row[c], std::max<std::size_t>(widths[c], 1));
        height = std::max(height, cells[c].size());
    }
    for (std::size_t line = 0; line < height; ++line) {
        for (std::size_t c = 0; c < kColumns; ++c) {
            const std::string text = line < cells[c].size() ? cells[c][line] : std::string();
            const auto length = DisplayLength(text);
            out << "| " << text << std::string(widths[c] > length ? widths[c] - length : 0, ' ') << ' ';
        }
        out << "|\n";
    }
}

}  // namespace

std::vector<std::string> NormalizeLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (const auto ch : text) {
        if (ch == '\n') {
            lines.push_back(utils::TrimRight(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        lines.push_back(utils::TrimRight(current));
    }
    while (!lines.empty() && utils::IsBlank(lines.back())) {
        lines.pop_back();
    }
    return lines;
}

bool OutputsMatch(const std::string& expected, const std::string& actual) {
    return NormalizeLines(expected) == NormalizeLines(actual);
}

LineDiff DiffLines(const std::string& expected, const std::string& actual) {
    const auto expected_lines = NormalizeLines(expected);
    const auto actual_lines = NormalizeLines(actual);

    LineDiff diff{};
    const auto count = std::max(expected_lines.size(), actual_lines.size());
    for (std::size_t i = 0; i < count; ++i) {
        const std::string expected_line = i < expected_lines.size() ? expected_lines[i] : std::string();
        const std::string actual_line = i < actual_lines.size() ? actual_lines[i] : std::string();
        if (expected_line != actual_line) {
            diff.rows.push_back(DiffRow{i + 1, expected_line, actual_line});
        }
        if (diff.rows.size() >= kMaxDiffRows) {
            diff.truncated = true;
            break;
        }
    }
    return diff;
}

std::string RenderDiff(const std::string& expected, const std::string& actual, std::size_t width) {
    const auto diff = DiffLines(expected, actual);

    std::vector<Row> rows;
    rows.push_back({"Line", "Output file", "Your program's output"});
    for (const auto& row : diff.rows) {
        rows.push_back({std::to_string(row.line_number), row.expected, row.actual});
    }
    if (diff.truncated) {
        rows.push_back({"...", "...", "..."});
    }

    const auto widths = ColumnWidths(rows, width);
    std::ostringstream out;
    AppendSeparator(out, widths, '-');
    AppendRow(out, rows.front(), widths);
    AppendSeparator(out, widths, '=');
    for (std::size_t i = 1; i < rows.size(); ++i) {
        AppendRow(out, rows[i], widths);
        AppendSeparator(out, widths, '-');
    }
    return out.str();
}

std::size_t TerminalWidth() {
    struct winsize size {};
    if (::isatty(STDOUT_FILENO) && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
        return size.ws_col;
    }
    return kFallbackTerminalWidth;
}

}  // namespace verdict::judge
