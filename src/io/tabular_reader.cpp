#include "io/tabular_reader.hpp"
#include "api/url_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>

namespace tabfetch {

HeaderSpec::HeaderSpec()
    : value_(std::vector<int>{1})
{
}

HeaderSpec HeaderSpec::row(int n) {
    return rows({n});
}

HeaderSpec HeaderSpec::rows(std::vector<int> numbers) {
    if (numbers.empty()) {
        throw ConfigurationError("Header row list must not be empty");
    }
    for (int n : numbers) {
        if (n < 1) {
            throw ConfigurationError("Header rows are 1-based; got " + std::to_string(n));
        }
    }
    HeaderSpec spec;
    spec.value_ = std::move(numbers);
    return spec;
}

HeaderSpec HeaderSpec::names(std::vector<std::string> names) {
    if (names.empty()) {
        throw ConfigurationError("Header name list must not be empty");
    }
    HeaderSpec spec;
    spec.value_ = std::move(names);
    return spec;
}

std::size_t HeaderSpec::last_row() const {
    if (has_names()) {
        return 0;
    }
    const std::vector<int>& numbers = row_numbers();
    return static_cast<std::size_t>(*std::max_element(numbers.begin(), numbers.end()));
}

// ----------------------------------------------------------------------------
// RowStream
// ----------------------------------------------------------------------------

namespace {

bool is_blank(const Row& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& cell) { return cell.empty(); });
}

} // namespace

RowStream::RowStream(std::shared_ptr<LiveResponse> response, const TabularOptions& options)
    : response_(std::move(response))
    , buf_(response_)
    , in_(&buf_)
    , reader_(in_, options.delimiter == '\0' ? ',' : options.delimiter)
    , ignore_blank_rows_(options.ignore_blank_rows)
    , closed_(false)
{
    in_.exceptions(std::ios::badbit);
    response_->set_cursor_open(true);
    try {
        std::string sample = buf_.sample();
        if (options.delimiter == '\0') {
            reader_.set_delimiter(CsvReader::sniff_delimiter(strip_bom(sample)));
        }
        if (sample.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            in_.ignore(3);
        }
        resolve_headers(options);
    } catch (const TabfetchError&) {
        close();
        throw;
    }
}

RowStream::~RowStream() {
    close();
}

void RowStream::resolve_headers(const TabularOptions& options) {
    if (options.header.has_names()) {
        original_headers_ = options.header.column_names();
    } else {
        std::vector<Row> records;
        Row record;
        std::size_t last = options.header.last_row();
        while (records.size() < last && reader_.read_row(record)) {
            records.push_back(record);
        }

        std::vector<const Row*> header_rows;
        std::size_t width = 0;
        for (int n : options.header.row_numbers()) {
            std::size_t index = static_cast<std::size_t>(n) - 1;
            if (index >= records.size()) {
                throw DecodeError("Header row " + std::to_string(n) + " is past the end of a table with " +
                                  std::to_string(records.size()) + " records",
                                  DecodeError::npos, static_cast<std::size_t>(n));
            }
            header_rows.push_back(&records[index]);
            width = std::max(width, records[index].size());
        }

        original_headers_.assign(width, std::string());
        for (std::size_t col = 0; col < width; ++col) {
            std::string& name = original_headers_[col];
            for (const Row* header_row : header_rows) {
                if (col >= header_row->size() || (*header_row)[col].empty()) {
                    continue;
                }
                if (!name.empty()) {
                    name += ' ';
                }
                name += (*header_row)[col];
            }
        }
        if (is_blank(original_headers_)) {
            throw DecodeError("Header rows contain no column names");
        }
    }

    headers_ = original_headers_;
    for (const Insertion& insertion : options.insertions) {
        std::size_t position = std::min(insertion.position, headers_.size());
        headers_.insert(headers_.begin() + static_cast<std::ptrdiff_t>(position), insertion.name);
    }
}

bool RowStream::read_record(Row& row) {
    try {
        return reader_.read_row(row);
    } catch (const TabfetchError&) {
        close();
        throw;
    }
}

bool RowStream::next_record(Row& row) {
    if (closed_) {
        return false;
    }
    if (response_->closed()) {
        close();
        throw StateError("Response was superseded by a newer request; cursor is no longer valid");
    }

    while (read_record(row)) {
        if (ignore_blank_rows_ && is_blank(row)) {
            continue;
        }
        if (row.size() < original_headers_.size()) {
            row.resize(original_headers_.size());
        }
        return true;
    }
    close();
    return false;
}

void RowStream::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    response_->set_cursor_open(false);
    response_->close();
}

namespace detail {

template <>
Row shape_row<Row>(const Row&, Row cells) {
    return cells;
}

template <>
RowDict shape_row<RowDict>(const Row& original_headers, Row cells) {
    RowDict dict;
    for (std::size_t i = 0; i < original_headers.size(); ++i) {
        dict[original_headers[i]] = i < cells.size() ? std::move(cells[i]) : std::string();
    }
    return dict;
}

} // namespace detail

// ----------------------------------------------------------------------------
// TabularReader
// ----------------------------------------------------------------------------

TabularReader::TabularReader(HttpClient& client)
    : client_(client)
{
}

std::unique_ptr<RowStream> TabularReader::open_stream(const std::string& url, const TabularOptions& options) {
    std::shared_ptr<LiveResponse> current = client_.current_response();
    if (current && !current->closed() && current->cursor_open()) {
        throw StateError("A row cursor is already open on this client; exhaust or close it first");
    }

    RequestOptions request = options.request;
    request.stream = true;
    LiveResponse& response = client_.request(url, request);
    if (!response.ok()) {
        long status = response.status();
        client_.close();
        throw NetworkError("HTTP " + std::to_string(status) + " reading table from " + truncate_for_log(url),
                           status, url);
    }

    Logger::get_instance().log_debug("Opening tabular stream", {{"url", truncate_for_log(url)}});
    return std::make_unique<RowStream>(client_.current_response(), options);
}

RowCursor<Row> TabularReader::open_rows(const std::string& url, const TabularOptions& options,
                                        RowFunction<Row> row_fn) {
    return RowCursor<Row>(open_stream(url, options), std::move(row_fn), options.include_headers);
}

RowCursor<RowDict> TabularReader::open_dict_rows(const std::string& url, const TabularOptions& options,
                                                 RowFunction<RowDict> row_fn) {
    return RowCursor<RowDict>(open_stream(url, options), std::move(row_fn), false);
}

std::map<std::string, std::string> TabularReader::download_key_value(const std::string& url, bool include_headers,
                                                                     TabularOptions options,
                                                                     RowFunction<Row> row_fn) {
    options.include_headers = include_headers;
    RowCursor<Row> cursor = open_rows(url, options, std::move(row_fn));

    std::map<std::string, std::string> output;
    while (std::optional<Row> row = cursor.next()) {
        if (row->size() < 2) {
            continue;
        }
        output[(*row)[0]] = (*row)[1];
    }
    return output;
}

const std::string& TabularReader::key_header(const Row& headers, std::size_t keycolumn) {
    if (keycolumn < 1 || keycolumn > headers.size()) {
        throw ConfigurationError("Key column " + std::to_string(keycolumn) + " is outside the " +
                                 std::to_string(headers.size()) + " header columns");
    }
    return headers[keycolumn - 1];
}

std::map<std::string, RowDict> TabularReader::download_rows_as_dicts(const std::string& url, std::size_t keycolumn,
                                                                     const TabularOptions& options,
                                                                     RowFunction<RowDict> row_fn) {
    RowCursor<RowDict> cursor = open_dict_rows(url, options, std::move(row_fn));
    const std::string key = key_header(cursor.headers(), keycolumn);

    std::map<std::string, RowDict> output;
    while (std::optional<RowDict> row = cursor.next()) {
        RowDict& entry = output[(*row)[key]];
        entry.clear();
        for (auto& [header, value] : *row) {
            if (header != key) {
                entry[header] = value;
            }
        }
    }
    return output;
}

std::map<std::string, RowDict> TabularReader::download_cols_as_dicts(const std::string& url, std::size_t keycolumn,
                                                                     const TabularOptions& options,
                                                                     RowFunction<RowDict> row_fn) {
    RowCursor<RowDict> cursor = open_dict_rows(url, options, std::move(row_fn));
    const std::string key = key_header(cursor.headers(), keycolumn);

    std::map<std::string, RowDict> output;
    for (const std::string& header : cursor.headers()) {
        if (header != key) {
            output[header];
        }
    }
    while (std::optional<RowDict> row = cursor.next()) {
        const std::string& key_value = (*row)[key];
        for (const auto& [header, value] : *row) {
            if (header != key) {
                output[header][key_value] = value;
            }
        }
    }
    return output;
}

std::map<std::string, std::size_t> TabularReader::column_positions(const Row& headers) {
    std::map<std::string, std::size_t> positions;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        positions[headers[i]] = i;
    }
    return positions;
}

Row TabularReader::hxl_row(const Row& headers, const std::map<std::string, std::string>& hxltags) {
    Row row;
    row.reserve(headers.size());
    for (const std::string& header : headers) {
        auto it = hxltags.find(header);
        row.push_back(it != hxltags.end() ? it->second : std::string());
    }
    return row;
}

RowDict TabularReader::hxl_row_dict(const Row& headers, const std::map<std::string, std::string>& hxltags) {
    RowDict row;
    for (const std::string& header : headers) {
        auto it = hxltags.find(header);
        row[header] = it != hxltags.end() ? it->second : std::string();
    }
    return row;
}

} // namespace tabfetch
