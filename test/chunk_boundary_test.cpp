/**
 * @file chunk_boundary_test.cpp
 * @brief Rows must not depend on where the input is split into chunks.
 */

#include <gtest/gtest.h>
#include "streamcsv/stream_parser.h"

#include <string>
#include <vector>

using namespace streamcsv;

namespace {

struct Parsed {
    std::vector<std::vector<std::pair<std::string, std::string>>> rows;
    std::vector<ErrorCode> errors;

    bool operator==(const Parsed& other) const {
        return rows == other.rows && errors == other.errors;
    }
};

void collect(const ParseResult& result, Parsed& out) {
    for (const auto& row : result.rows) {
        std::vector<std::pair<std::string, std::string>> fields;
        for (const auto& field : row) {
            fields.emplace_back(field.name, field.value);
        }
        out.rows.push_back(std::move(fields));
    }
    if (result.error) {
        out.errors.push_back(result.error->code);
    }
}

// Feed the chunks, then keep calling finish() until it has nothing left
Parsed run(const std::vector<std::string>& chunks, const ParserOptions& opts) {
    StreamParser parser(opts);
    Parsed out;
    for (const auto& chunk : chunks) {
        collect(parser.ingest(chunk), out);
    }
    for (int i = 0; i < 16; ++i) {
        ParseResult result = parser.finish();
        if (result.ok() && result.rows.empty()) {
            break;
        }
        collect(result, out);
    }
    return out;
}

void expect_split_invariant(const std::string& input, const ParserOptions& opts) {
    Parsed whole = run({input}, opts);

    for (size_t cut = 0; cut <= input.size(); ++cut) {
        Parsed split = run({input.substr(0, cut), input.substr(cut)}, opts);
        EXPECT_TRUE(split == whole) << "split at byte " << cut;
    }

    std::vector<std::string> bytes;
    for (char c : input) {
        bytes.emplace_back(1, c);
    }
    EXPECT_TRUE(run(bytes, opts) == whole) << "byte-by-byte";
}

std::string to_utf16le(const std::string& ascii) {
    std::string out("\xFF\xFE", 2);
    for (char c : ascii) {
        out.push_back(c);
        out.push_back('\0');
    }
    return out;
}

} // namespace

TEST(ChunkBoundaryTest, PlainRows) {
    expect_split_invariant("name,age\nJohn,30\nJane,25\n", ParserOptions());
}

TEST(ChunkBoundaryTest, QuotedFieldsWithSeparatorsAndNewlines) {
    expect_split_invariant("a,b\n\"x,y\",\"line1\nline2\"\n\"He said \"\"hi\"\"\",z\n",
                           ParserOptions());
}

TEST(ChunkBoundaryTest, CrLfAndUnterminatedFinalRow) {
    expect_split_invariant("a,b\r\n1,2\r\n3,4", ParserOptions());
}

TEST(ChunkBoundaryTest, DistinctEscape) {
    ParserOptions opts;
    opts.dialect.escape_char = '\\';
    expect_split_invariant("a,b\n\"q\\\"\n,\",2\n\"p\",3\n", opts);
}

TEST(ChunkBoundaryTest, CommentsAndSkipLines) {
    ParserOptions opts;
    opts.with_comments();
    opts.skip_lines = 1;
    expect_split_invariant("junk\n# comment\na,b\n\n1,2\n#x\n3,4\n", opts);
}

TEST(ChunkBoundaryTest, Utf8Bom) {
    expect_split_invariant("\xEF\xBB\xBF" "a,b\n1,\xC3\xA9\n", ParserOptions());
}

TEST(ChunkBoundaryTest, Utf16WithSurrogatePair) {
    std::string input = to_utf16le("a,b\n1,");
    input += std::string("\x3D\xD8\x00\xDE", 4);  // U+1F600
    input += to_utf16le("\n\"q,\n\",2\n").substr(2);
    expect_split_invariant(input, ParserOptions());
}

TEST(ChunkBoundaryTest, StrictErrors) {
    ParserOptions opts;
    opts.strict = true;
    expect_split_invariant("a,b\n1,2\n3\n4,5\n6,7,8\n9,10\n", opts);
}
