#include <gtest/gtest.h>
#include "datamap/name_view.hpp"
#include "datamap/errors.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>
#include <vector>

using namespace datamap;

namespace {

FieldMap makeEntry(std::initializer_list<std::pair<const char*, const char*>> names) {
    FieldMap nameMap;
    for (const auto& [lang, name] : names) {
        nameMap.set(lang, name);
    }

    FieldMap raw;
    raw.set("name", std::move(nameMap));
    return raw;
}

}  // namespace

class NameViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.insert(makeEntry({{"en", "Fire"}, {"ja", "火"}}));
        store.insert(makeEntry({{"en", "Ice"}, {"ja", "氷"}}));
    }

    Store store;
};

TEST_F(NameViewTest, Contains) {
    auto names = store.names("en");
    EXPECT_TRUE(names.contains("Fire"));
    EXPECT_TRUE(names.contains("Ice"));
    EXPECT_FALSE(names.contains("Water"));
    EXPECT_FALSE(names.contains("火"));
}

TEST_F(NameViewTest, IteratesInInsertionOrder) {
    std::vector<std::string> names;
    for (const auto& name : store.names("en")) {
        names.push_back(name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"Fire", "Ice"}));
}

TEST_F(NameViewTest, OtherLanguage) {
    auto names = store.names("ja");
    EXPECT_EQ(names.language(), "ja");
    EXPECT_EQ(std::vector<std::string>(names.begin(), names.end()),
              (std::vector<std::string>{"火", "氷"}));
}

TEST_F(NameViewTest, ReflectsLaterInserts) {
    auto names = store.names("en");
    EXPECT_FALSE(names.contains("Water"));

    store.insert(makeEntry({{"en", "Water"}, {"ja", "水"}}));

    EXPECT_TRUE(names.contains("Water"));
    EXPECT_EQ(names.size(), 3u);
    EXPECT_EQ(std::count(names.begin(), names.end(), "Water"), 1);
}

TEST_F(NameViewTest, ReflectsRenames) {
    auto names = store.names("en");
    store.setName(1, "en", "Blaze");

    EXPECT_FALSE(names.contains("Fire"));
    EXPECT_TRUE(names.contains("Blaze"));
    EXPECT_EQ(*names.begin(), "Blaze");
}

TEST_F(NameViewTest, MissingLanguageThrowsDuringIteration) {
    store.insert(makeEntry({{"en", "Water"}}));

    auto names = store.names("ja");
    auto it = names.begin();
    EXPECT_EQ(*it, "火");
    ++it;
    EXPECT_EQ(*it, "氷");
    ++it;
    EXPECT_THROW((void)*it, KeyNotFound);
}

TEST_F(NameViewTest, UnknownLanguageStillTestable) {
    auto names = store.names("fr");
    EXPECT_FALSE(names.contains("Fire"));
    EXPECT_THROW((void)*names.begin(), KeyNotFound);
}

TEST(NameViewEmptyTest, EmptyStore) {
    Store store;
    auto names = store.names("en");
    EXPECT_EQ(names.begin(), names.end());
    EXPECT_EQ(names.size(), 0u);
    EXPECT_FALSE(names.contains("Fire"));
}

TEST_F(NameViewTest, IteratorOutlivesView) {
    auto it = store.names("en").begin();
    EXPECT_EQ(*it, "Fire");
    ++it;
    EXPECT_EQ(*it, "Ice");
}

TEST_F(NameViewTest, IteratorOutlivesMovedFromView) {
    auto names = store.names("ja");
    auto it = names.begin();
    auto moved = std::move(names);

    EXPECT_EQ(*it, "火");
    EXPECT_EQ(moved.language(), "ja");
}

TEST(NameViewOverwriteTest, SharedNameStaysVisibleAfterErase) {
    StoreOptions options;
    options.nameCollision = NameCollisionPolicy::Overwrite;
    Store store(options);

    store.insert(makeEntry({{"en", "Fire"}}));
    store.insert(makeEntry({{"en", "Fire"}}));
    store.erase(2);

    auto names = store.names("en");
    EXPECT_TRUE(names.contains("Fire"));
    EXPECT_EQ(std::count(names.begin(), names.end(), "Fire"), 1);
}
