// File: DelimitedText.hpp
// Description: Declares the CSV-style reader and writer used for the export,
//              the roster and the report, with a configurable delimiter.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace backend {

using DelimitedRow = std::vector<std::string>;

// Splits text into rows of fields. Quoted fields may contain the delimiter,
// line breaks and doubled quotes. Blank lines are skipped. A bare quote in an
// unquoted field, stray text after a closing quote, or an unterminated quote
// throws FatalInputError naming the line.
std::vector<DelimitedRow> parseDelimited(const std::string& text, char delimiter);

// Quotes a field when it holds the delimiter, a quote, CR or LF, or starts
// with a space or tab.
std::string formatDelimitedField(const std::string& field, char delimiter);
std::string formatDelimitedRow(const DelimitedRow& row, char delimiter);

// Throws FatalInputError when the file cannot be opened or read.
std::string readFileBytes(const std::filesystem::path& path);

}  // namespace backend
