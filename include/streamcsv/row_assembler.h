#ifndef STREAMCSV_ROW_ASSEMBLER_H
#define STREAMCSV_ROW_ASSEMBLER_H

#include "streamcsv/error.h"
#include "streamcsv/options.h"
#include "streamcsv/row.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace streamcsv {

enum class HeaderState {
    AWAITING_FIRST_ROW,  ///< No row has reached the assembler yet
    ACTIVE               ///< Labels are resolved; every row is data
};

enum class AssembleStatus {
    ROW,     ///< A data row was produced
    HEADER,  ///< The row was consumed as the header
    ERROR    ///< The row was rejected; see the error code
};

/**
 * @brief Resolves column labels and turns cell lists into rows.
 *
 * Receives only rows that survived comment and skip-lines filtering. The
 * first such row resolves the labels according to the header policy in
 * ParserOptions; explicit labels are resolved at construction instead.
 * Mapped-away columns keep an empty label, which marks them as dropped.
 */
class RowAssembler {
public:
    explicit RowAssembler(const ParserOptions& options);

    /**
     * @brief Feed one tokenized row.
     *
     * @param cells Decoded cells (moved from)
     * @param row_number Logical row number of the row
     * @param byte_offset Row start in the canonical stream
     * @param[out] row Set when ROW is returned
     * @param[out] error Set when ERROR is returned
     */
    AssembleStatus consume(std::vector<std::string>&& cells, size_t row_number,
                           size_t byte_offset, Row& row, ErrorCode& error);

    HeaderState state() const { return state_; }

    /// Resolved labels after mapping, or nullopt before resolution
    const std::optional<std::vector<std::string>>& headers() const { return headers_; }

    /// Forget resolved labels, unless they were given explicitly
    void reset();

private:
    void resolve(std::vector<std::string> labels);
    ErrorCode assemble(std::vector<std::string>&& cells, size_t row_number,
                       size_t byte_offset, Row& row) const;

    ParserOptions options_;
    HeaderState state_ = HeaderState::AWAITING_FIRST_ROW;
    std::optional<std::vector<std::string>> headers_;
    // Position in Row::fields() each column writes to, DROPPED_COLUMN if none
    std::vector<size_t> slots_;
    std::unordered_map<std::string, size_t> label_slots_;
};

} // namespace streamcsv

#endif // STREAMCSV_ROW_ASSEMBLER_H
