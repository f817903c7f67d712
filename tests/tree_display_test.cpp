#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "filetree/cli.h"
#include "filetree/config_file.h"
#include "filetree/errors.h"
#include "filetree/sink.h"
#include "filetree/tree_display.h"
#include "test_support.h"

namespace filetree {
namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

class TreeDisplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_.make_file("src/main.cpp");
        tmp_.make_file("notes.txt");
        options_.root_dir = tmp_.root();
        options_.save_to_file = false;
    }

    test::TempDir tmp_;
    Config::Options options_;
    std::ostringstream out_;
};

constexpr const char* kExpected = "project/\n"
                                  "├── src/\n"
                                  "│   └── main.cpp\n"
                                  "└── notes.txt";

TEST_F(TreeDisplayTest, ReturnsAssembledText) {
    TreeDisplay display{options_, out_};
    EXPECT_EQ(display.display(), kExpected);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(display.last_count(), (EntryCount{1, 2, 0}));
}

TEST_F(TreeDisplayTest, SavesNextToRootByDefault) {
    options_.save_to_file = true;
    TreeDisplay display{options_, out_};
    display.display();
    EXPECT_EQ(read_file(sink::default_output_path(tmp_.root())), std::string{kExpected} + "\n");
}

TEST_F(TreeDisplayTest, SavesToExplicitPath) {
    options_.save_to_file = true;
    options_.filepath = tmp_.base() / "tree.txt";
    TreeDisplay display{options_, out_};
    display.display();
    EXPECT_EQ(read_file(*options_.filepath), std::string{kExpected} + "\n");
}

TEST_F(TreeDisplayTest, UnwritableOutputThrows) {
    options_.save_to_file = true;
    options_.filepath = tmp_.base() / "no" / "such" / "tree.txt";
    TreeDisplay display{options_, out_};
    EXPECT_THROW(display.display(), OutputError);
}

TEST_F(TreeDisplayTest, PrintoutAndCount) {
    options_.printout = true;
    options_.entry_count = true;
    TreeDisplay display{options_, out_};
    display.display();
    EXPECT_EQ(out_.str(), std::string{kExpected} + "\n1 directory, 2 files\n");
}

TEST_F(TreeDisplayTest, StreamingPrintsAndReturnsNothing) {
    options_.stream_output = true;
    options_.save_to_file = true;
    options_.entry_count = true;
    TreeDisplay display{options_, out_};
    EXPECT_EQ(display.display(), "");
    EXPECT_EQ(out_.str(), std::string{kExpected} + "\n1 directory, 2 files\n");
    EXPECT_FALSE(std::filesystem::exists(sink::default_output_path(tmp_.root())));
}

TEST_F(TreeDisplayTest, InvalidRootThrows) {
    options_.root_dir = tmp_.base() / "missing";
    TreeDisplay missing{options_, out_};
    EXPECT_THROW(missing.display(), InvalidRoot);

    options_.root_dir = tmp_.root() / "notes.txt";
    TreeDisplay file{options_, out_};
    try {
        file.display();
        FAIL() << "expected InvalidRoot";
    } catch (const InvalidRoot& ex) {
        EXPECT_NE(std::string{ex.what()}.find("is not a directory."), std::string::npos);
    }
}

TEST_F(TreeDisplayTest, ConfigurationErrorsSurfaceAtConstruction) {
    auto bad_style = options_;
    bad_style.style = "fancy";
    EXPECT_THROW((TreeDisplay{bad_style, out_}), UnknownStyle);

    auto bad_sort = options_;
    bad_sort.sort_key = "custom";
    EXPECT_THROW((TreeDisplay{bad_sort, out_}), MissingComparator);

}

TEST_F(TreeDisplayTest, CustomComparator) {
    options_.sort_key = "custom";
    options_.custom_sort = [](std::string_view lhs, std::string_view rhs) { return lhs > rhs; };
    tmp_.make_file("zeta.txt");
    TreeDisplay display{options_, out_};
    const auto text = display.display();
    EXPECT_LT(text.find("zeta.txt"), text.find("notes.txt"));
}

TEST_F(TreeDisplayTest, UserStyleIsUsable) {
    options_.style = "bullets";
    EXPECT_THROW((TreeDisplay{options_, out_}), UnknownStyle);

    options_.style = "classic";
    TreeDisplay display{options_, out_};
    display.styles().register_style("bullets", "* ", "- ", "|");
    auto changed = options_;
    changed.style = "bullets";
    display.reconfigure(changed);
    EXPECT_EQ(display.display(), "project/\n* src/\n| - main.cpp\n- notes.txt");
}

TEST_F(TreeDisplayTest, ListOptionsFilterTheTree) {
    options_.ignore_dirs = {"src"};
    TreeDisplay display{options_, out_};
    EXPECT_EQ(display.display(), "project/\n└── notes.txt");
}

TEST_F(TreeDisplayTest, NamesInOptionsAreLiteral) {
    tmp_.make_file("[draft].md");
    const std::string expected = "project/\n"
                                 "├── src/\n"
                                 "│   └── main.cpp\n"
                                 "└── notes.txt";

    auto direct = options_;
    direct.ignore_files = {"[draft].md"};
    TreeDisplay from_api{direct, out_};
    EXPECT_EQ(from_api.display(), expected);

    Cli cli;
    std::vector<const char*> argv{"filetree", "--no-save", "--ignore-files", "['[draft].md']"};
    auto parsed = cli.parse(static_cast<int>(argv.size()), argv.data());
    ASSERT_EQ(parsed.ignore_files, (std::vector<std::string>{"[draft].md"}));
    parsed.root_dir = tmp_.root();
    TreeDisplay from_cli{parsed, out_};
    EXPECT_EQ(from_cli.display(), expected);

    auto from_json = options_;
    config_file::apply_text(R"({"ignore_files": ["[draft].md"]})", from_json);
    TreeDisplay from_file{from_json, out_};
    EXPECT_EQ(from_file.display(), expected);

    auto unfiltered = options_;
    TreeDisplay all{unfiltered, out_};
    EXPECT_NE(all.display().find("[draft].md"), std::string::npos);
}

TEST_F(TreeDisplayTest, InFlightWalkerKeepsItsFilters) {
    auto lister = test::sample_lister();
    TreeDisplay display{options_, out_, lister};
    auto walker = display.build_tree("/r");

    auto changed = options_;
    changed.ignore_files = {"a.txt", "c.txt", "x.txt"};
    display.reconfigure(changed);

    EXPECT_EQ(test::collect(walker).size(), 5u);
    auto fresh = display.build_tree("/r");
    EXPECT_EQ(test::collect(fresh), (std::vector<std::string>{"├── b/", "└── d/"}));
}

} // namespace
} // namespace filetree
