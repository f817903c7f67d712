#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "filetree/errors.h"
#include "filetree/filters.h"
#include "filetree/string_utils.h"

namespace filetree {
namespace {

using Names = std::vector<std::string>;

TEST(NamePredicateTest, IgnoreRemovesNames) {
    auto keep = make_name_predicate({".git", "node_modules"}, {});
    EXPECT_FALSE(keep(".git"));
    EXPECT_FALSE(keep("node_modules"));
    EXPECT_TRUE(keep("src"));
}

TEST(NamePredicateTest, IncludeRestrictsWhenNonEmpty) {
    auto keep = make_name_predicate({}, {"src", "docs"});
    EXPECT_TRUE(keep("src"));
    EXPECT_TRUE(keep("docs"));
    EXPECT_FALSE(keep("build"));
}

TEST(NamePredicateTest, IgnoreWinsOverInclude) {
    auto keep = make_name_predicate({"src"}, {"src", "docs"});
    EXPECT_FALSE(keep("src"));
    EXPECT_TRUE(keep("docs"));
}

TEST(NamePredicateTest, WildcardPatterns) {
    auto keep = make_name_predicate({"*.log"}, {});
    EXPECT_FALSE(keep("app.log"));
    EXPECT_TRUE(keep("app.txt"));

    auto versions = make_name_predicate({}, {"v?"});
    EXPECT_TRUE(versions("v1"));
    EXPECT_FALSE(versions("v10"));
}

TEST(NamePredicateTest, MatchingIsCaseSensitive) {
    auto keep = make_name_predicate({"Build"}, {});
    EXPECT_TRUE(keep("build"));
    EXPECT_FALSE(keep("Build"));
}

TEST(FilterPairTest, DirectoryAndFileSetsAreIndependent) {
    FilterSets sets;
    sets.ignore_dirs = {"target"};
    sets.include_files = {"*.cpp"};
    auto filters = build_filters(sets);

    EXPECT_FALSE(filters.dir_filter("target"));
    EXPECT_TRUE(filters.dir_filter("main.cpp"));
    EXPECT_TRUE(filters.file_filter("main.cpp"));
    EXPECT_FALSE(filters.file_filter("target"));
}

TEST(FilterPairTest, AllowAllAdmitsEverything) {
    auto filters = allow_all_filters();
    EXPECT_TRUE(filters.dir_filter(".git"));
    EXPECT_TRUE(filters.file_filter(""));
}

TEST(WildcardMatchTest, StarAndQuestionMark) {
    EXPECT_TRUE(string_utils::wildcard_match("*", ""));
    EXPECT_TRUE(string_utils::wildcard_match("a*c", "abbbc"));
    EXPECT_TRUE(string_utils::wildcard_match("?.txt", "a.txt"));
    EXPECT_FALSE(string_utils::wildcard_match("?.txt", "ab.txt"));
    EXPECT_FALSE(string_utils::wildcard_match("a*c", "abd"));
}

TEST(ParseNameListTest, PlainItemsPassThrough) {
    EXPECT_EQ(parse_name_list({".git", "build"}), (Names{".git", "build"}));
    EXPECT_TRUE(parse_name_list({}).empty());
}

TEST(ParseNameListTest, BracketedList) {
    EXPECT_EQ(parse_name_list({"['.git', \"build\"]"}), (Names{".git", "build"}));
    EXPECT_EQ(parse_name_list({"  [ 'a' ,'b', ]  "}), (Names{"a", "b"}));
    EXPECT_EQ(parse_name_list({"['it\\'s']"}), (Names{"it's"}));
    EXPECT_TRUE(parse_name_list({"[]"}).empty());
}

TEST(ParseNameListTest, MalformedListsThrow) {
    EXPECT_THROW(parse_name_list({"['a'"}), InvalidFilterSyntax);
    EXPECT_THROW(parse_name_list({"[a]"}), InvalidFilterSyntax);
    EXPECT_THROW(parse_name_list({"['a' 'b']"}), InvalidFilterSyntax);
    EXPECT_THROW(parse_name_list({"['a]"}), InvalidFilterSyntax);
    EXPECT_THROW(parse_name_list({"['a',,]"}), InvalidFilterSyntax);
}

TEST(ParseNameListTest, ErrorNamesTheInput) {
    try {
        (void)parse_name_list({"[a]"});
        FAIL() << "expected InvalidFilterSyntax";
    } catch (const InvalidFilterSyntax& ex) {
        EXPECT_NE(std::string{ex.what()}.find("Invalid list syntax: [a]"), std::string::npos);
    }
}

} // namespace
} // namespace filetree
