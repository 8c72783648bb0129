/**
 * @file tabular_reader.hpp
 * @brief Row-by-row reading of delimited tables fetched through HttpClient
 */

#ifndef TABFETCH_IO_TABULAR_READER_HPP
#define TABFETCH_IO_TABULAR_READER_HPP

#include "api/http_client.hpp"
#include "io/csv_reader.hpp"
#include "io/response_streambuf.hpp"
#include <cstddef>
#include <functional>
#include <istream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tabfetch {

using Row = std::vector<std::string>;
using RowDict = std::map<std::string, std::string>;

/**
 * @brief Where the column names of a table come from
 *
 * Either 1-based row numbers in the file (several rows are joined column-wise
 * with a space) or explicit names, in which case every record is data.
 */
class HeaderSpec {
public:
    /** @brief Header on row 1 */
    HeaderSpec();

    /** @throws ConfigurationError if n < 1 */
    static HeaderSpec row(int n);

    /** @throws ConfigurationError if empty or any number < 1 */
    static HeaderSpec rows(std::vector<int> numbers);

    /** @throws ConfigurationError if empty */
    static HeaderSpec names(std::vector<std::string> names);

    bool has_names() const { return std::holds_alternative<std::vector<std::string>>(value_); }
    const std::vector<int>& row_numbers() const { return std::get<std::vector<int>>(value_); }
    const std::vector<std::string>& column_names() const { return std::get<std::vector<std::string>>(value_); }

    /** @brief Physical records consumed by the header; 0 for explicit names */
    std::size_t last_row() const;

private:
    std::variant<std::vector<int>, std::vector<std::string>> value_;
};

/**
 * @brief Synthetic column added to the resolved headers
 *
 * `position` is 0-based; positions past the end append.
 */
struct Insertion {
    std::size_t position;
    std::string name;
};

struct TabularOptions {
    HeaderSpec header;
    std::vector<Insertion> insertions;       ///< Applied in order
    bool include_headers = false;            ///< List form: yield the headers first
    bool ignore_blank_rows = true;
    char delimiter = '\0';                   ///< '\0' infers from the first record
    RequestOptions request;
};

/**
 * @brief Per-row transform; std::nullopt drops the row
 */
template <typename RowT>
using RowFunction = std::function<std::optional<RowT>(const Row& original_headers, RowT row)>;

/**
 * @brief Header resolution and record iteration over one response
 *
 * Marks the response as having an open cursor until close(). Exhaustion or an
 * error while reading closes it.
 */
class RowStream {
public:
    /**
     * @throws ConfigurationError on an invalid header specification
     * @throws DecodeError if a designated header row is missing, the header
     *         rows hold no names, or they cannot be parsed
     */
    RowStream(std::shared_ptr<LiveResponse> response, const TabularOptions& options);
    ~RowStream();

    RowStream(const RowStream&) = delete;
    RowStream& operator=(const RowStream&) = delete;

    const Row& headers() const { return headers_; }
    const Row& original_headers() const { return original_headers_; }

    /**
     * @brief Next data record, padded to the original header width
     *
     * @return false once exhausted
     * @throws StateError if the response was closed underneath the cursor
     * @throws DecodeError or NetworkError while reading
     */
    bool next_record(Row& row);

    void close();
    bool closed() const { return closed_; }

private:
    std::shared_ptr<LiveResponse> response_;
    ResponseStreamBuf buf_;
    std::istream in_;
    CsvReader reader_;
    Row original_headers_;
    Row headers_;
    bool ignore_blank_rows_;
    bool closed_;

    void resolve_headers(const TabularOptions& options);
    bool read_record(Row& row);
};

namespace detail {

template <typename RowT>
RowT shape_row(const Row& original_headers, Row cells);

template <>
Row shape_row<Row>(const Row& original_headers, Row cells);

template <>
RowDict shape_row<RowDict>(const Row& original_headers, Row cells);

} // namespace detail

/**
 * @brief Forward-only cursor yielding Row or RowDict values
 */
template <typename RowT>
class RowCursor {
public:
    RowCursor(std::unique_ptr<RowStream> stream, RowFunction<RowT> row_fn, bool include_headers)
        : stream_(std::move(stream))
        , row_fn_(std::move(row_fn))
        , headers_pending_(include_headers)
    {
    }

    RowCursor(RowCursor&&) = default;
    RowCursor& operator=(RowCursor&&) = default;

    const Row& headers() const { return stream_->headers(); }
    const Row& original_headers() const { return stream_->original_headers(); }

    /**
     * @brief Next row after blank filtering and the row function
     *
     * @return std::nullopt once exhausted
     */
    std::optional<RowT> next() {
        if constexpr (std::is_same_v<RowT, Row>) {
            if (headers_pending_) {
                headers_pending_ = false;
                return stream_->headers();
            }
        }
        Row cells;
        while (stream_->next_record(cells)) {
            RowT row = detail::shape_row<RowT>(stream_->original_headers(), std::move(cells));
            if (!row_fn_) {
                return row;
            }
            std::optional<RowT> result = row_fn_(stream_->original_headers(), std::move(row));
            if (result) {
                return result;
            }
        }
        return std::nullopt;
    }

    void close() { stream_->close(); }
    bool closed() const { return stream_->closed(); }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = RowT;
        using difference_type = std::ptrdiff_t;
        using pointer = const RowT*;
        using reference = const RowT&;

        iterator() : cursor_(nullptr) {}
        explicit iterator(RowCursor* cursor) : cursor_(cursor) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return cursor_ == other.cursor_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        RowCursor* cursor_;
        std::optional<RowT> current_;

        void advance() {
            current_ = cursor_->next();
            if (!current_) {
                cursor_ = nullptr;
            }
        }
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::unique_ptr<RowStream> stream_;
    RowFunction<RowT> row_fn_;
    bool headers_pending_;
};

/**
 * @brief Tabular views over responses of one HttpClient
 *
 * Only one cursor may be open per client. Opening a second while the first
 * still holds the current response raises StateError.
 */
class TabularReader {
public:
    explicit TabularReader(HttpClient& client);

    /**
     * @brief Rows as lists of cells
     *
     * @throws StateError if a cursor is already open on the client
     * @throws NetworkError on failure or a non-2xx status
     */
    RowCursor<Row> open_rows(const std::string& url, const TabularOptions& options = TabularOptions(),
                             RowFunction<Row> row_fn = RowFunction<Row>());

    /**
     * @brief Rows as maps from original header to cell
     */
    RowCursor<RowDict> open_dict_rows(const std::string& url, const TabularOptions& options = TabularOptions(),
                                      RowFunction<RowDict> row_fn = RowFunction<RowDict>());

    /**
     * @brief First column to second column; rows with fewer than two cells are skipped
     */
    std::map<std::string, std::string> download_key_value(const std::string& url, bool include_headers = true,
                                                          TabularOptions options = TabularOptions(),
                                                          RowFunction<Row> row_fn = RowFunction<Row>());

    /**
     * @brief Key column value to the rest of that row
     *
     * @param keycolumn 1-based position in the resolved headers
     * @throws ConfigurationError if keycolumn is out of range
     */
    std::map<std::string, RowDict> download_rows_as_dicts(const std::string& url, std::size_t keycolumn = 1,
                                                          const TabularOptions& options = TabularOptions(),
                                                          RowFunction<RowDict> row_fn = RowFunction<RowDict>());

    /**
     * @brief Header to a map of key column value to that column's cell
     */
    std::map<std::string, RowDict> download_cols_as_dicts(const std::string& url, std::size_t keycolumn = 1,
                                                          const TabularOptions& options = TabularOptions(),
                                                          RowFunction<RowDict> row_fn = RowFunction<RowDict>());

    static std::map<std::string, std::size_t> column_positions(const Row& headers);

    /**
     * @brief HXL hashtag row for the given headers, empty where no tag is known
     */
    static Row hxl_row(const Row& headers, const std::map<std::string, std::string>& hxltags);
    static RowDict hxl_row_dict(const Row& headers, const std::map<std::string, std::string>& hxltags);

private:
    HttpClient& client_;

    std::unique_ptr<RowStream> open_stream(const std::string& url, const TabularOptions& options);
    static const std::string& key_header(const Row& headers, std::size_t keycolumn);
};

} // namespace tabfetch

#endif // TABFETCH_IO_TABULAR_READER_HPP
