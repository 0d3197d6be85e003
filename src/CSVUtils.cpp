#include "CSVUtils.h"
#include "PrognosExceptions.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) return;

    char bom[3] = {0, 0, 0};
    is.read(bom, 3);
    const bool isBom = is.gcount() == 3 &&
                       static_cast<unsigned char>(bom[1]) == 0xBB &&
                       static_cast<unsigned char>(bom[2]) == 0xBF;
    if (isBom) return;

    is.clear(is.rdstate() & ~std::ios::eofbit & ~std::ios::failbit);
    for (std::streamsize i = 0; i < is.gcount(); ++i) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      size_t* consumedLines,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (consumedLines) *consumedLines = 0;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool sawData = false;
    bool overLimit = false;
    char c;

    auto pushField = [&]() {
        row.push_back(currentFieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        currentFieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) overLimit = true;
    };

    while (is.get(c)) {
        if (c == '"') {
            sawData = true;
            if (!inQuotes && CSVUtils::trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                currentFieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
            sawData = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (consumedLines) ++(*consumedLines);
            if (!inQuotes) break;
            val += '\n';
        } else {
            val += c;
            sawData = true;
        }

        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) overLimit = true;
        if (overLimit) break;
    }

    if ((inQuotes || overLimit) && malformed) *malformed = true;
    if (!sawData && val.empty()) return {};
    if (row.empty() && !currentFieldQuoted && trimUnquotedField(val).empty()) return {};
    pushField();
    return row;
}

CSVTable readTable(std::istream& is, char delimiter, const ParseLimits& limits) {
    CSVTable table;
    skipBOM(is);

    bool malformed = false;
    size_t lines = 0;
    size_t lineNo = 1;
    table.header = parseCSVLine(is, delimiter, &malformed, &lines, limits);
    if (malformed || table.header.empty()) {
        throw Prognos::DatasetException("Malformed or empty CSV header");
    }

    std::unordered_set<std::string> seen;
    for (const auto& name : table.header) {
        if (name.empty()) throw Prognos::DatasetException("CSV header contains an empty column name");
        if (!seen.insert(name).second) {
            throw Prognos::DatasetException("CSV header contains duplicate column '" + name + "'");
        }
    }
    lineNo += lines;

    while (is.peek() != EOF) {
        const size_t startLine = lineNo;
        auto row = parseCSVLine(is, delimiter, &malformed, &lines, limits);
        lineNo += std::max<size_t>(lines, 1);
        if (row.empty()) continue;
        if (malformed || row.size() != table.header.size()) {
            ++table.malformedRows;
            continue;
        }
        table.rows.push_back(std::move(row));
        table.rowLineNumbers.push_back(startLine);
    }
    return table;
}
} // namespace CSVUtils
