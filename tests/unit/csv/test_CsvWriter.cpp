#include <doctest/doctest.h>
#include "csv/CsvWriter.hpp"
#include "CaseTreeTestHelper.hpp"

#include <array>
#include <string_view>

using namespace CT::Csv;

TEST_SUITE("csv.writer") {

TEST_CASE("plain fields are written as is") {
    CHECK(formatField("A") == "A");
    CHECK(formatField("") == "");
    CHECK(formatField("Individual Gate") == "Individual Gate");
}

TEST_CASE("fields needing quotes") {
    CHECK(formatField("a,b") == "\"a,b\"");
    CHECK(formatField("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(formatField("two\nlines") == "\"two\nlines\"");
    CHECK(formatField("cr\r") == "\"cr\r\"");
}

TEST_CASE("rows end with crlf") {
    std::array<std::string_view, 3> const fields{"A", "DUPLICATE_ENTRY", "first CSV"};
    CHECK(formatRow(fields) == "A,DUPLICATE_ENTRY,first CSV\r\n");
}

TEST_CASE("written rows read back unchanged") {
    std::array<std::string_view, 3> const fields{"a,b", "OS_ERROR", "path \"x\"\nsecond line"};
    auto rows = CT::Testing::rowsFrom(formatRow(fields));
    REQUIRE(rows.size() == 1);
    CHECK(rows[0] == Row{"a,b", "OS_ERROR", "path \"x\"\nsecond line"});
}

} // TEST_SUITE
