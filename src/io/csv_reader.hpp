/**
 * @file csv_reader.hpp
 * @brief Incremental delimited-text record reader
 */

#ifndef TABFETCH_IO_CSV_READER_HPP
#define TABFETCH_IO_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace tabfetch {

/**
 * @brief Reads one physical record at a time from a stream
 *
 * Fields may be quoted with '"'; a quoted field can hold the delimiter,
 * doubled quotes and line breaks. Records end at \n, \r\n or \r. An empty
 * line is returned as a single empty field.
 */
class CsvReader {
public:
    using Row = std::vector<std::string>;

    explicit CsvReader(std::istream& is, char delimiter = ',');

    /**
     * @brief Read the next record into `row`
     *
     * @return false at end of input
     * @throws DecodeError on a quoted field left open at end of input
     */
    bool read_row(Row& row);

    bool has_more() const;

    char delimiter() const { return delimiter_; }
    void set_delimiter(char delimiter) { delimiter_ = delimiter; }

    /** @brief Physical records returned so far */
    std::size_t records_read() const { return records_; }

    /**
     * @brief Guess the delimiter of the first record in `sample`
     *
     * Candidates are ',', ';', '\t' and '|', counted outside quotes; ties go
     * to the earlier candidate and ',' is used when none occurs.
     */
    static char sniff_delimiter(const std::string& sample);

private:
    std::istream& is_;
    char delimiter_;
    std::size_t line_;
    std::size_t records_;

    void consume_line_end(int c);
};

} // namespace tabfetch

#endif // TABFETCH_IO_CSV_READER_HPP
