#include <doctest/doctest.h>
#include "fs/DirectoryMaterializer.hpp"
#include "CaseTreeTestHelper.hpp"

using namespace CT;
using namespace CT::Fs;
using CT::Testing::TempDir;

TEST_SUITE("fs.directory_materializer") {

TEST_CASE("creates missing directories") {
    TempDir dir("materializer");
    auto    target = dir.path / "A";

    auto result = ensureDir(target, false);
    REQUIRE(result.has_value());
    CHECK(*result == EnsureDirResult::Created);
    CHECK(std::filesystem::is_directory(target));
}

TEST_CASE("repeated calls are harmless") {
    TempDir dir("materializer");
    auto    target = dir.path / "A";
    REQUIRE(ensureDir(target, true).has_value());
    Testing::writeFile(target / "keep.txt", "contents");

    for (bool parents : {true, false}) {
        auto again = ensureDir(target, parents);
        REQUIRE(again.has_value());
        CHECK(*again == EnsureDirResult::AlreadyExists);
    }
    CHECK(Testing::readFile(target / "keep.txt") == "contents");
}

TEST_CASE("missing parent without createParents touches nothing") {
    TempDir dir("materializer");
    auto    target = dir.path / "A" / "Homepage";

    auto result = ensureDir(target, false);
    REQUIRE(result.has_value());
    CHECK(*result == EnsureDirResult::ParentMissing);
    CHECK_FALSE(std::filesystem::exists(dir.path / "A"));
}

TEST_CASE("createParents builds the whole chain") {
    TempDir dir("materializer");
    auto    target = dir.path / "A" / "Individual Gate" / "s1";

    auto result = ensureDir(target, true);
    REQUIRE(result.has_value());
    CHECK(*result == EnsureDirResult::Created);
    CHECK(std::filesystem::is_directory(target));
}

TEST_CASE("a regular file in the way is an error") {
    TempDir dir("materializer");
    Testing::writeFile(dir.path / "A", "file");

    auto result = ensureDir(dir.path / "A", true);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::InvalidPath);
}

TEST_CASE("result names") {
    CHECK(ensureDirResultToString(EnsureDirResult::Created) == "created");
    CHECK(ensureDirResultToString(EnsureDirResult::AlreadyExists) == "already_exists");
    CHECK(ensureDirResultToString(EnsureDirResult::ParentMissing) == "parent_missing");
}

} // TEST_SUITE
