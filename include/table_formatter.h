#ifndef TABLE_FORMATTER_H
#define TABLE_FORMATTER_H

#include <string>
#include <vector>
#include <cstddef>

/**
 * @brief A single table row, one string per column
 */
using TableRow = std::vector<std::string>;

/**
 * @brief Column-aligned plain text tables
 *
 * Every cell is left-aligned and padded with spaces to the widest cell of
 * its column plus a fixed gap. The last column is padded too, so rows carry
 * trailing spaces. Rows may have different column counts.
 */
class TableFormatter {
public:
    static const std::size_t DEFAULT_INDENT;
    static const std::size_t DEFAULT_PADDING;

    /**
     * @brief Format rows into aligned text, one line per row
     * @param rows Rows to format, in output order
     * @param indent Number of spaces written before the first column
     * @param padding Number of spaces added after the widest cell of each column
     * @return Formatted table, every line terminated by '\n'
     */
    static std::string format(const std::vector<TableRow>& rows,
                              std::size_t indent = DEFAULT_INDENT,
                              std::size_t padding = DEFAULT_PADDING);

    /**
     * @brief Compute the width of every column
     * @param rows Rows to measure
     * @return Width of the widest cell per column index
     */
    static std::vector<std::size_t> columnWidths(const std::vector<TableRow>& rows);

    /**
     * @brief Display width of a UTF-8 string (number of code points)
     */
    static std::size_t displayWidth(const std::string& text);
};

#endif // TABLE_FORMATTER_H
