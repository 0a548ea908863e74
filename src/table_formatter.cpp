#include "table_formatter.h"
#include <algorithm>

const std::size_t TableFormatter::DEFAULT_INDENT = 4;
const std::size_t TableFormatter::DEFAULT_PADDING = 4;

std::size_t TableFormatter::displayWidth(const std::string& text) {
    std::size_t width = 0;
    for (unsigned char c : text) {
        // Continuation bytes (10xxxxxx) belong to the previous code point
        if ((c & 0xC0) != 0x80) {
            width++;
        }
    }
    return width;
}

std::vector<std::size_t> TableFormatter::columnWidths(const std::vector<TableRow>& rows) {
    std::vector<std::size_t> widths;
    for (const auto& row : rows) {
        if (row.size() > widths.size()) {
            widths.resize(row.size(), 0);
        }
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], displayWidth(row[i]));
        }
    }
    return widths;
}

std::string TableFormatter::format(const std::vector<TableRow>& rows,
                                   std::size_t indent,
                                   std::size_t padding) {
    const std::vector<std::size_t> widths = columnWidths(rows);

    std::string output;
    for (const auto& row : rows) {
        output.append(indent, ' ');
        for (std::size_t i = 0; i < row.size(); ++i) {
            const std::string& cell = row[i];
            output += cell;
            output.append(widths[i] - displayWidth(cell) + padding, ' ');
        }
        output += '\n';
    }
    return output;
}
