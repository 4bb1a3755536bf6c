#ifndef STREAMCSV_ROW_H
#define STREAMCSV_ROW_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace streamcsv {

/**
 * @brief One labeled cell of a row.
 */
struct Field {
    std::string name;
    std::string value;
    size_t index = 0;  ///< Column index of the cell in the source row

    bool operator==(const Field& other) const {
        return name == other.name && value == other.value && index == other.index;
    }
};

/**
 * @brief A parsed data row.
 *
 * A row carries two views of the same record:
 * - values(): the decoded cells in source order, before any value mapping.
 * - fields(): label to value pairs in header order, followed by synthetic
 *   "_N" labels for cells past the header. Dropped columns are absent and a
 *   repeated label appears once, at its first position, with the last value.
 *
 * Rows own their data and stay valid after the parser moves on.
 */
class Row {
public:
    Row() = default;
    Row(std::vector<std::string> values, std::vector<Field> fields,
        size_t row_number, size_t byte_offset)
        : values_(std::move(values)), fields_(std::move(fields)),
          row_number_(row_number), byte_offset_(byte_offset) {}

    /// Number of cells in the source row
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::vector<std::string>& values() const { return values_; }

    /// Cell by position, with bounds checking
    const std::string& at(size_t index) const;

    const std::vector<Field>& fields() const { return fields_; }

    /// Value by label, or nullptr if the row has no such label
    const std::string* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Value by label; throws std::out_of_range if the label is missing
    const std::string& operator[](const std::string& name) const;

    /// Logical row number (1-based, counts header, comment and skipped rows)
    size_t row_number() const { return row_number_; }

    /// Offset of the row start in the canonical UTF-8 stream
    size_t byte_offset() const { return byte_offset_; }

    std::vector<Field>::const_iterator begin() const { return fields_.begin(); }
    std::vector<Field>::const_iterator end() const { return fields_.end(); }

private:
    std::vector<std::string> values_;
    std::vector<Field> fields_;
    size_t row_number_ = 0;
    size_t byte_offset_ = 0;
};

} // namespace streamcsv

#endif // STREAMCSV_ROW_H
