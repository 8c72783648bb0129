#include "io/csv_reader.hpp"
#include "errors.hpp"
#include <array>

namespace tabfetch {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_(1), records_(0) {}

void CsvReader::consume_line_end(int c) {
    if (c == '\r' && is_.peek() == '\n') {
        is_.get();
    }
    ++line_;
}

bool CsvReader::read_row(Row& row) {
    row.clear();
    if (!has_more()) {
        return false;
    }

    std::string cell;
    bool in_quotes = false;
    std::size_t start_line = line_;

    while (true) {
        int c = is_.get();
        if (c == std::char_traits<char>::eof()) {
            if (in_quotes) {
                throw DecodeError("Unterminated quoted field starting on line " + std::to_string(start_line),
                                  DecodeError::npos, start_line);
            }
            break;
        }

        if (in_quotes) {
            if (c == '"') {
                if (is_.peek() == '"') {
                    is_.get();
                    cell.push_back('"');
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n' || (c == '\r' && is_.peek() != '\n')) {
                    ++line_;
                }
                cell.push_back(static_cast<char>(c));
            }
            continue;
        }

        if (c == '"' && cell.empty()) {
            in_quotes = true;
        } else if (c == delimiter_) {
            row.push_back(std::move(cell));
            cell.clear();
        } else if (c == '\n' || c == '\r') {
            consume_line_end(c);
            break;
        } else {
            cell.push_back(static_cast<char>(c));
        }
    }

    row.push_back(std::move(cell));
    ++records_;
    return true;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != std::char_traits<char>::eof();
}

char CsvReader::sniff_delimiter(const std::string& sample) {
    static constexpr std::array<char, 4> kCandidates = {',', ';', '\t', '|'};
    std::array<std::size_t, 4> counts = {0, 0, 0, 0};

    bool in_quotes = false;
    for (char c : sample) {
        if (c == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (in_quotes) {
            continue;
        }
        if (c == '\n' || c == '\r') {
            break;
        }
        for (std::size_t i = 0; i < kCandidates.size(); ++i) {
            if (c == kCandidates[i]) {
                ++counts[i];
            }
        }
    }

    std::size_t best = 0;
    for (std::size_t i = 1; i < kCandidates.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return counts[best] > 0 ? kCandidates[best] : ',';
}

} // namespace tabfetch
