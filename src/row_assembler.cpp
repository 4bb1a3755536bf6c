#include "streamcsv/row_assembler.h"

#include <spdlog/spdlog.h>

#include <limits>

namespace streamcsv {

namespace {

constexpr size_t DROPPED_COLUMN = std::numeric_limits<size_t>::max();

} // namespace

RowAssembler::RowAssembler(const ParserOptions& options) : options_(options) {
    if (options_.headers && !options_.headers->empty()) {
        resolve(*options_.headers);
    }
}

void RowAssembler::reset() {
    state_ = HeaderState::AWAITING_FIRST_ROW;
    headers_.reset();
    if (options_.headers && !options_.headers->empty()) {
        resolve(*options_.headers);
    }
}

void RowAssembler::resolve(std::vector<std::string> labels) {
    if (options_.map_headers) {
        for (size_t i = 0; i < labels.size(); ++i) {
            std::optional<std::string> mapped = options_.map_headers(labels[i], i);
            labels[i] = mapped ? std::move(*mapped) : std::string();
        }
    }

    // A repeated label shares the slot of its first occurrence
    slots_.assign(labels.size(), DROPPED_COLUMN);
    label_slots_.clear();
    for (size_t i = 0; i < labels.size(); ++i) {
        if (!labels[i].empty()) {
            slots_[i] = label_slots_.emplace(labels[i], label_slots_.size()).first->second;
        }
    }

    SPDLOG_DEBUG("resolved {} column label(s), {} distinct", labels.size(),
                 label_slots_.size());
    headers_ = std::move(labels);
    state_ = HeaderState::ACTIVE;
}

AssembleStatus RowAssembler::consume(std::vector<std::string>&& cells, size_t row_number,
                                     size_t byte_offset, Row& row, ErrorCode& error) {
    if (state_ == HeaderState::AWAITING_FIRST_ROW) {
        if (!options_.headers) {
            // Auto-detect: the row itself is the header
            resolve(std::move(cells));
            return AssembleStatus::HEADER;
        }

        // Numeric labels sized to the first data row
        std::vector<std::string> labels;
        labels.reserve(cells.size());
        for (size_t i = 0; i < cells.size(); ++i) {
            labels.push_back(std::to_string(i));
        }
        resolve(std::move(labels));
    }

    error = assemble(std::move(cells), row_number, byte_offset, row);
    return error == ErrorCode::NONE ? AssembleStatus::ROW : AssembleStatus::ERROR;
}

ErrorCode RowAssembler::assemble(std::vector<std::string>&& cells, size_t row_number,
                                 size_t byte_offset, Row& row) const {
    if (!headers_) {
        return ErrorCode::NO_HEADERS_DEFINED;
    }
    const std::vector<std::string>& labels = *headers_;

    if (options_.strict && cells.size() != labels.size()) {
        return ErrorCode::INCONSISTENT_FIELD_COUNT;
    }

    std::vector<Field> fields;
    fields.reserve(cells.size());

    for (size_t i = 0; i < cells.size(); ++i) {
        std::string name;
        size_t slot;
        if (i < labels.size()) {
            slot = slots_[i];
            if (slot == DROPPED_COLUMN) {
                continue;
            }
            name = labels[i];
        } else {
            name = "_" + std::to_string(i);
            auto it = label_slots_.find(name);
            slot = it != label_slots_.end() ? it->second : fields.size();
        }

        std::string value = options_.map_values
                                ? options_.map_values(name, i, cells[i])
                                : cells[i];

        // A repeated label keeps its first position and takes the last value
        if (slot < fields.size()) {
            fields[slot].value = std::move(value);
            fields[slot].index = i;
        } else {
            fields.push_back(Field{std::move(name), std::move(value), i});
        }
    }

    row = Row(std::move(cells), std::move(fields), row_number, byte_offset);
    return ErrorCode::NONE;
}

} // namespace streamcsv
