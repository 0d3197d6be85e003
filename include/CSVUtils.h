#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization. Typed conversion of cells happens in CohortStore.
struct ParseLimits {
	size_t maxFieldBytes = 1024 * 1024;
	size_t maxColumns = 4096;
};

struct CSVTable {
	std::vector<std::string> header;
	std::vector<std::vector<std::string>> rows;
	std::vector<size_t> rowLineNumbers;
	size_t malformedRows = 0;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record, honouring quoted fields that span lines.
 * @post `malformed` is set when a quote is left open or a limit is exceeded.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  size_t* consumedLines = nullptr,
									  const ParseLimits& limits = ParseLimits{});

/**
 * @brief Reads a header row and every data row from `is`.
 * @post Rows whose width differs from the header are counted as malformed and dropped.
 * @throws Prognos::DatasetException if the header is empty, malformed or has duplicate names.
 */
CSVTable readTable(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});
}
