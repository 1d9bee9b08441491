#include <gtest/gtest.h>
#include "datamap/config_parser.hpp"

#include <filesystem>
#include <fstream>

using namespace datamap;

class ConfigParserTest : public ::testing::Test {
protected:
    ConfigParser parser;
};

TEST_F(ConfigParserTest, SimpleKeyValue) {
    auto doc = parser.parseString("name_collision: reject\n");

    EXPECT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.getString("name_collision"), "reject");
}

TEST_F(ConfigParserTest, CommentsAndBlankLinesIgnored) {
    auto doc = parser.parseString(
        "# store settings\n"
        "\n"
        "first_id: 5\n"
        "   \n"
        "# trailing comment\n"
    );

    EXPECT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.getInt("first_id"), 5);
}

TEST_F(ConfigParserTest, WhitespaceTrimmed) {
    auto doc = parser.parseString("  first_id :   42  \r\n");

    auto* entry = doc.get("first_id");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->value.asString(), "42");
}

TEST_F(ConfigParserTest, LaterEntriesOverride) {
    auto doc = parser.parseString(
        "first_id: 1\n"
        "first_id: 7\n"
    );

    EXPECT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.getInt("first_id"), 7);
}

TEST_F(ConfigParserTest, LineNumbersRecorded) {
    auto doc = parser.parseString(
        "# header\n"
        "a: 1\n"
        "\n"
        "b: 2\n"
    );

    ASSERT_NE(doc.get("b"), nullptr);
    EXPECT_EQ(doc.get("a")->line, 2);
    EXPECT_EQ(doc.get("b")->line, 4);
}

TEST_F(ConfigParserTest, BareKey) {
    auto doc = parser.parseString("strict\n");

    auto* entry = doc.get("strict");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->value.empty());
}

TEST_F(ConfigParserTest, Defaults) {
    auto doc = parser.parseString("");

    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(doc.get("missing"), nullptr);
    EXPECT_EQ(doc.getString("missing", "fallback"), "fallback");
    EXPECT_EQ(doc.getInt("missing", 3), 3);
}

TEST_F(ConfigParserTest, IntegerParsing) {
    EXPECT_EQ(ConfigValue("12").asInteger(), 12);
    EXPECT_EQ(ConfigValue("-3").asInteger(), -3);
    EXPECT_FALSE(ConfigValue("12abc").asInteger().has_value());
    EXPECT_FALSE(ConfigValue("abc").asInteger().has_value());
    EXPECT_FALSE(ConfigValue("").asInteger().has_value());
    EXPECT_FALSE(ConfigValue("99999999999999999999999").asInteger().has_value());
}

TEST_F(ConfigParserTest, IncludeRelativeToBasePath) {
    auto dir = std::filesystem::temp_directory_path() / "datamap_config_parser_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream file(dir / "base.conf");
        file << "first_id: 10\n";
    }

    auto doc = parser.parseString(
        "name_collision: overwrite\n"
        "include: base.conf\n",
        dir.string() + "/"
    );

    EXPECT_EQ(doc.getString("name_collision"), "overwrite");
    EXPECT_EQ(doc.getInt("first_id"), 10);

    std::filesystem::remove_all(dir);
}

// ============================================================================
// File parsing
// ============================================================================

class ConfigParserFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "datamap_config_file_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream file(tempDir / name);
        file << content;
    }

    std::filesystem::path tempDir;
    ConfigParser parser;
};

TEST_F(ConfigParserFileTest, MissingFile) {
    EXPECT_FALSE(parser.parseFile((tempDir / "nope.conf").string()).has_value());
}

TEST_F(ConfigParserFileTest, RelativeIncludeOverrides) {
    write("defaults.conf", "first_id: 1\nname_collision: reject\n");
    write("store.conf", "include: defaults.conf\nfirst_id: 50\n");

    auto doc = parser.parseFile((tempDir / "store.conf").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->getInt("first_id"), 50);
    EXPECT_EQ(doc->getString("name_collision"), "reject");
}

TEST_F(ConfigParserFileTest, MissingIncludeSkipped) {
    write("store.conf", "include: absent.conf\nfirst_id: 2\n");

    auto doc = parser.parseFile((tempDir / "store.conf").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 1u);
    EXPECT_EQ(doc->getInt("first_id"), 2);
}

TEST_F(ConfigParserFileTest, SelfIncludeSkipped) {
    write("self.conf", "first_id: 3\ninclude: self.conf\nname_collision: overwrite\n");

    auto doc = parser.parseFile((tempDir / "self.conf").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 2u);
    EXPECT_EQ(doc->getInt("first_id"), 3);
    EXPECT_EQ(doc->getString("name_collision"), "overwrite");
}

TEST_F(ConfigParserFileTest, MutualIncludeSkipped) {
    write("a.conf", "include: b.conf\nname_collision: overwrite\n");
    write("b.conf", "include: ./a.conf\nfirst_id: 9\n");

    auto doc = parser.parseFile((tempDir / "a.conf").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 2u);
    EXPECT_EQ(doc->getInt("first_id"), 9);
    EXPECT_EQ(doc->getString("name_collision"), "overwrite");
}

TEST_F(ConfigParserFileTest, RepeatedIncludeOutsideCycleAllowed) {
    write("common.conf", "first_id: 4\n");
    write("store.conf", "include: common.conf\nfirst_id: 8\ninclude: common.conf\n");

    auto doc = parser.parseFile((tempDir / "store.conf").string());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 3u);
    EXPECT_EQ(doc->getInt("first_id"), 4);
}
