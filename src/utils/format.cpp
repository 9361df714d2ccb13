#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace qkdsim {
namespace utils {

std::string Formatter::formatNumber(uint64_t num) {
    std::string str = std::to_string(num);
    int insertPosition = static_cast<int>(str.length()) - 3;
    while (insertPosition > 0) { str.insert(insertPosition, ","); insertPosition -= 3; }
    return str;
}

std::string Formatter::formatRatio(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Formatter::padLeft(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return std::string(width - str.length(), padChar) + str;
}

std::string Formatter::padRight(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return str + std::string(width - str.length(), padChar);
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

TableFormatter::TableFormatter() : borderChar('|'), headerSeparator('-') {}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers = hdrs;
    columnWidths.resize(std::max(columnWidths.size(), headers.size()), 0);
    for (size_t i = 0; i < headers.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], headers[i].length());
    }
}

void TableFormatter::addRow(const std::vector<std::string>& row) {
    rows.push_back(row);
    for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], row[i].length());
    }
}

void TableFormatter::setRightAligned(size_t column, bool right) {
    if (rightAligned.size() <= column) rightAligned.resize(column + 1, false);
    rightAligned[column] = right;
}

std::string TableFormatter::render() const {
    std::stringstream ss;
    ss << renderRow(headers);
    ss << renderSeparator();
    for (const auto& row : rows) ss << renderRow(row);
    return ss.str();
}

std::string TableFormatter::renderRow(const std::vector<std::string>& row) const {
    std::stringstream ss;
    ss << borderChar;
    for (size_t i = 0; i < columnWidths.size(); i++) {
        std::string cell = (i < row.size()) ? row[i] : "";
        bool right = i < rightAligned.size() && rightAligned[i];
        cell = right ? Formatter::padLeft(cell, columnWidths[i]) : Formatter::padRight(cell, columnWidths[i]);
        ss << " " << cell << " " << borderChar;
    }
    ss << "\n";
    return ss.str();
}

std::string TableFormatter::renderSeparator() const {
    std::stringstream ss;
    ss << borderChar;
    for (size_t width : columnWidths) ss << std::string(width + 2, headerSeparator) << borderChar;
    ss << "\n";
    return ss.str();
}

}
}
