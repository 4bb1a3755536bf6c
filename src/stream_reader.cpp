#include "streamcsv/stream_reader.h"

#include <fstream>
#include <istream>
#include <stdexcept>
#include <utility>

namespace streamcsv {

//-----------------------------------------------------------------------------
// RowIterator implementation
//-----------------------------------------------------------------------------

RowIterator::RowIterator(StreamReader* reader) : reader_(reader) {
    ++*this;
}

RowIterator::reference RowIterator::operator*() const {
    return reader_->row();
}

RowIterator::pointer RowIterator::operator->() const {
    return &reader_->row();
}

RowIterator& RowIterator::operator++() {
    if (reader_ && !reader_->next_row()) {
        reader_ = nullptr;
    }
    return *this;
}

//-----------------------------------------------------------------------------
// StreamReader implementation
//-----------------------------------------------------------------------------

struct StreamReader::Impl {
    StreamParser parser;
    std::unique_ptr<std::ifstream> owned_file;
    std::istream* input = nullptr;
    std::vector<char> read_buffer;
    size_t total_bytes_read = 0;

    // Rows from the last parser call not yet handed out
    std::vector<Row> rows;
    size_t next_index = 0;
    Row current_row;
    bool done = false;

    Impl(const ParserOptions& options, size_t chunk_size)
        : parser(options) {
        if (chunk_size == 0) {
            throw std::invalid_argument("chunk_size must be positive");
        }
        read_buffer.resize(chunk_size);
    }

    // Run one parser call. Returns false once the parser has nothing left.
    bool fill() {
        input->read(read_buffer.data(), static_cast<std::streamsize>(read_buffer.size()));
        std::streamsize bytes_read = input->gcount();

        ParseResult result;
        if (bytes_read > 0) {
            total_bytes_read += static_cast<size_t>(bytes_read);
            result = parser.ingest(reinterpret_cast<const uint8_t*>(read_buffer.data()),
                                   static_cast<size_t>(bytes_read));
        } else {
            // finish() may hand back a held error first, so keep calling it
            // until it returns nothing
            result = parser.finish();
            if (result.ok() && result.rows.empty()) {
                done = true;
                return false;
            }
        }

        if (result.error) {
            throw ParseException(*result.error);
        }
        rows = std::move(result.rows);
        next_index = 0;
        return true;
    }
};

StreamReader::StreamReader(const std::string& filename, const ParserOptions& options,
                           size_t chunk_size)
    : impl_(std::make_unique<Impl>(options, chunk_size)) {
    impl_->owned_file = std::make_unique<std::ifstream>(filename, std::ios::binary);
    if (!impl_->owned_file->is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    impl_->input = impl_->owned_file.get();
}

StreamReader::StreamReader(std::istream& input, const ParserOptions& options,
                           size_t chunk_size)
    : impl_(std::make_unique<Impl>(options, chunk_size)) {
    impl_->input = &input;
}

StreamReader::~StreamReader() = default;

StreamReader::StreamReader(StreamReader&&) noexcept = default;
StreamReader& StreamReader::operator=(StreamReader&&) noexcept = default;

bool StreamReader::next_row() {
    while (true) {
        if (impl_->next_index < impl_->rows.size()) {
            impl_->current_row = std::move(impl_->rows[impl_->next_index]);
            ++impl_->next_index;
            return true;
        }

        impl_->rows.clear();
        impl_->next_index = 0;

        if (impl_->done || !impl_->fill()) {
            return false;
        }
    }
}

const Row& StreamReader::row() const {
    return impl_->current_row;
}

std::vector<std::string> StreamReader::header() const {
    return impl_->parser.current_headers().value_or(std::vector<std::string>());
}

const StreamParser& StreamReader::parser() const {
    return impl_->parser;
}

size_t StreamReader::bytes_read() const {
    return impl_->total_bytes_read;
}

bool StreamReader::eof() const {
    return impl_->done && impl_->next_index >= impl_->rows.size();
}

RowIterator StreamReader::begin() {
    return RowIterator(this);
}

RowIterator StreamReader::end() {
    return RowIterator();
}

} // namespace streamcsv
