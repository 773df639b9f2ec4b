#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace verdict::judge {

constexpr std::size_t kMaxDiffRows = 99;
constexpr std::size_t kFallbackTerminalWidth = 40;

struct DiffRow {
    std::size_t line_number = 0;
    std::string expected;
    std::string actual;
};

struct LineDiff {
    std::vector<DiffRow> rows;
    bool truncated = false;
};

// Lines with trailing whitespace removed and trailing blank lines dropped.
std::vector<std::string> NormalizeLines(const std::string& text);

bool OutputsMatch(const std::string& expected, const std::string& actual);

// Compares normalized lines index by index; there is no insertion/deletion detection.
// Stops at kMaxDiffRows differing lines.
LineDiff DiffLines(const std::string& expected, const std::string& actual);

// Table of the differing lines, wrapped to fit `width` columns where possible.
std::string RenderDiff(const std::string& expected, const std::string& actual, std::size_t width);

// Columns of the terminal on stdout, or kFallbackTerminalWidth when it is not a terminal.
std::size_t TerminalWidth();

}  // namespace verdict::judge
