#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace spendguard {
namespace utils {

class Formatter {
public:
    static std::string formatNumber(uint64_t num);
    static std::string formatDurationMs(uint64_t millis);
    static std::string formatPercent(double value, int precision = 1);
    static std::string padLeft(const std::string& str, size_t width, char padChar = ' ');
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
};

class TableFormatter {
public:
    TableFormatter();
    void setHeaders(const std::vector<std::string>& hdrs);
    void addRow(const std::vector<std::string>& row);
    std::string render() const;
    std::string renderRow(const std::vector<std::string>& row) const;
    std::string renderSeparator() const;
    
private:
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
    char borderChar;
    char headerSeparator;
};

}
}
