#include <gtest/gtest.h>

#include "filetree/errors.h"
#include "filetree/string_utils.h"
#include "filetree/style.h"

namespace filetree {
namespace {

TEST(StyleRegistryTest, ClassicAtDefaultIndent) {
    StyleRegistry styles;
    const auto& spec = styles.resolve("classic");
    EXPECT_EQ(spec.branch, "├── ");
    EXPECT_EQ(spec.end, "└── ");
    EXPECT_EQ(spec.vertical, "│   ");
    EXPECT_EQ(spec.space, "    ");
}

TEST(StyleRegistryTest, AsciiStylesUseBarForContinuation) {
    StyleRegistry styles;
    const auto& dash = styles.resolve("dash");
    EXPECT_EQ(dash.branch, "|-- ");
    EXPECT_EQ(dash.end, "`-- ");
    EXPECT_EQ(dash.vertical, "|   ");

    const auto& plus = styles.resolve("plus");
    EXPECT_EQ(plus.branch, "+-- ");
    EXPECT_EQ(plus.end, "+== ");
    EXPECT_EQ(plus.vertical, "|   ");
}

TEST(StyleRegistryTest, ArrowKeepsClassicWidth) {
    StyleRegistry styles;
    const auto& arrow = styles.resolve("arrow");
    EXPECT_EQ(arrow.branch, "├─> ");
    EXPECT_EQ(arrow.end, "└─> ");
}

TEST(StyleRegistryTest, AllPiecesShareOneWidth) {
    for (int indent = StyleRegistry::kMinIndent; indent <= StyleRegistry::kMaxIndent; ++indent) {
        StyleRegistry styles{indent};
        for (const auto& name : styles.names()) {
            const auto& spec = styles.resolve(name);
            const auto width = string_utils::display_width(spec.branch);
            EXPECT_EQ(string_utils::display_width(spec.end), width) << name << " indent " << indent;
            EXPECT_EQ(string_utils::display_width(spec.vertical), width) << name << " indent " << indent;
            EXPECT_EQ(string_utils::display_width(spec.space), width) << name << " indent " << indent;
        }
    }
}

TEST(StyleRegistryTest, IndentIsClamped) {
    EXPECT_EQ(StyleRegistry{0}.indent(), StyleRegistry::kMinIndent);
    EXPECT_EQ(StyleRegistry{42}.indent(), StyleRegistry::kMaxIndent);
    EXPECT_EQ(StyleRegistry{1}.resolve("classic").branch, "├─ ");
}

TEST(StyleRegistryTest, UnknownStyleThrows) {
    StyleRegistry styles;
    EXPECT_FALSE(styles.contains("fancy"));
    try {
        (void)styles.resolve("fancy");
        FAIL() << "expected UnknownStyle";
    } catch (const UnknownStyle& ex) {
        EXPECT_STREQ(ex.what(), "Unknown style 'fancy'");
    }
}

TEST(StyleRegistryTest, UserStylesArePaddedAndSurviveReindent) {
    StyleRegistry styles;
    const auto& bullets = styles.register_style("bullets", "* ", "- ");
    EXPECT_EQ(bullets.space, "  ");
    EXPECT_EQ(bullets.vertical, "│ ");
    ASSERT_TRUE(styles.contains("bullets"));

    styles.set_indent(4);
    EXPECT_EQ(styles.resolve("classic").branch, "├──── ");
    EXPECT_EQ(styles.resolve("bullets").branch, "* ");
}

TEST(StyleRegistryTest, RegisteringAgainReplaces) {
    StyleRegistry styles;
    styles.register_style("classic", "> ", "> ");
    EXPECT_EQ(styles.resolve("classic").branch, "> ");
}

} // namespace
} // namespace filetree
