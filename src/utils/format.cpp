#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace spendguard {
namespace utils {

std::string Formatter::formatNumber(uint64_t num) {
    std::string str = std::to_string(num);
    int insertPosition = static_cast<int>(str.length()) - 3;
    while (insertPosition > 0) { str.insert(insertPosition, ","); insertPosition -= 3; }
    return str;
}

std::string Formatter::formatDurationMs(uint64_t millis) {
    if (millis < 1000) return std::to_string(millis) + "ms";
    uint64_t seconds = millis / 1000;
    if (seconds < 60) {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2) << (millis / 1000.0) << "s";
        return ss.str();
    }
    else if (seconds < 3600) return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    else return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
}

std::string Formatter::formatPercent(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << "%";
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

TableFormatter::TableFormatter() : borderChar('|'), headerSeparator('-') {}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers = hdrs;
    columnWidths.resize(headers.size(), 0);
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
        ss << " " << Formatter::padRight(cell, columnWidths[i]) << " " << borderChar;
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
