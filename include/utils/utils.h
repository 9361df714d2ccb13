#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace qkdsim {
namespace utils {

class Formatter {
public:
    static std::string formatNumber(uint64_t num);
    static std::string formatRatio(double value, int precision = 4);
    static std::string padLeft(const std::string& str, size_t width, char padChar = ' ');
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
};

class TableFormatter {
public:
    TableFormatter();
    void setHeaders(const std::vector<std::string>& hdrs);
    void addRow(const std::vector<std::string>& row);
    // Numeric columns read better flush right; headers follow the column.
    void setRightAligned(size_t column, bool right = true);
    std::string render() const;

private:
    std::string renderRow(const std::vector<std::string>& row) const;
    std::string renderSeparator() const;

    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
    std::vector<bool> rightAligned;
    char borderChar;
    char headerSeparator;
};

}
}
