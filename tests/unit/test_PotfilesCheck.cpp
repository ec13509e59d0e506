#include <gtest/gtest.h>
#include "check/PotfilesCheck.hpp"
#include "TempProject.hpp"

using namespace pc::check;
using namespace pc::manifest;
using pc::config::PotfilesConfig;

namespace {

constexpr auto SOURCE_MARKER = "let s = gettext(\"Hello\");\n";
constexpr auto UI_MARKER = R"(<property name="label" translatable="yes">Hello</property>)";
constexpr auto BLP_MARKER = "label: _(\"Hello\");\n";

}

class PotfilesCheckTest : public ::testing::Test {
protected:
    TempProject project;
    PotfilesConfig cfg;

    [[nodiscard]] CheckResult run() const { return PotfilesCheck(cfg, project.root()).run(); }
};

TEST_F(PotfilesCheckTest, ConsistentProjectPasses) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/b.rs", SOURCE_MARKER);
    project.write("src/c.ui", UI_MARKER);
    project.writeList("po/POTFILES.in", {"src/a.rs", "src/b.rs", "src/c.ui"});
    project.writeList("po/POTFILES.skip", {});

    const auto result = run();
    EXPECT_TRUE(result.passed());
    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.name, "po/POTFILES.in");
}

TEST_F(PotfilesCheckTest, MissingDeclaredFileAbortsRemainingSteps) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/undeclared.rs", SOURCE_MARKER);
    project.writeList("po/POTFILES.in", {"src/gone.rs", "src/a.rs"});

    const auto result = run();
    EXPECT_FALSE(result.passed());
    EXPECT_TRUE(result.aborted);
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::MissingFile);
    EXPECT_EQ(result.discrepancies[0].path, "src/gone.rs");
    EXPECT_EQ(result.discrepancies[0].origin, "po/POTFILES.in");
    EXPECT_EQ(result.discrepancies[0].line, 1u);
}

TEST_F(PotfilesCheckTest, MissingEntriesOfBothListsAreReported) {
    project.writeList("po/POTFILES.in", {"src/gone.rs"});
    project.writeList("po/POTFILES.skip", {"src/also-gone.ui"});

    const auto result = run();
    ASSERT_EQ(result.count(DiscrepancyKind::MissingFile), 2u);
    EXPECT_EQ(result.discrepancies[1].origin, "po/POTFILES.skip");
}

TEST_F(PotfilesCheckTest, DirectoryEntryCountsAsMissing) {
    fs::create_directories(project.root() / "src/dir.rs");
    project.writeList("po/POTFILES.in", {"src/dir.rs"});

    EXPECT_EQ(run().count(DiscrepancyKind::MissingFile), 1u);
}

TEST_F(PotfilesCheckTest, UnreadableManifestFails) {
    const auto result = run();
    EXPECT_TRUE(result.aborted);
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::UnreadableManifest);
    EXPECT_EQ(result.discrepancies[0].path, "po/POTFILES.in");
}

TEST_F(PotfilesCheckTest, AbsentSkipFileIsTreatedAsEmpty) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.writeList("po/POTFILES.in", {"src/a.rs"});

    EXPECT_TRUE(run().passed());
}

TEST_F(PotfilesCheckTest, UndeclaredBlueprintIsReportedOnce) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/b.rs", SOURCE_MARKER);
    project.write("src/c.ui", UI_MARKER);
    project.write("src/d.blp", BLP_MARKER);
    project.writeList("po/POTFILES.in", {"src/a.rs", "src/b.rs", "src/c.ui"});

    const auto result = run();
    EXPECT_FALSE(result.passed());
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::UndeclaredFile);
    EXPECT_EQ(result.discrepancies[0].path, "src/d.blp");
    EXPECT_EQ(result.discrepancies[0].category, Category::Blueprint);
}

TEST_F(PotfilesCheckTest, DeclaredFileWithoutMarkerIsStale) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/plain.rs", "fn main() {}\n");
    project.writeList("po/POTFILES.in", {"src/a.rs", "src/plain.rs"});

    const auto result = run();
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::StaleEntry);
    EXPECT_EQ(result.discrepancies[0].path, "src/plain.rs");
    EXPECT_EQ(result.discrepancies[0].origin, "po/POTFILES.in");
    EXPECT_EQ(result.discrepancies[0].line, 2u);
}

TEST_F(PotfilesCheckTest, SkippedFileIsNotUndeclared) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/debug.rs", SOURCE_MARKER);
    project.writeList("po/POTFILES.in", {"src/a.rs"});
    project.writeList("po/POTFILES.skip", {"src/debug.rs"});

    EXPECT_TRUE(run().passed());
}

TEST_F(PotfilesCheckTest, StaleSkipEntryNamesSkipFile) {
    project.write("src/plain.ui", "<interface/>");
    project.writeList("po/POTFILES.in", {});
    project.writeList("po/POTFILES.skip", {"src/plain.ui"});

    const auto result = run();
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::StaleEntry);
    EXPECT_EQ(result.discrepancies[0].origin, "po/POTFILES.skip");
}

TEST_F(PotfilesCheckTest, SkipCancelsBeforeManifest) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.writeList("po/POTFILES.in", {"src/a.rs"});
    project.writeList("po/POTFILES.skip", {"src/a.rs"});

    const auto result = run();
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::StaleEntry);
    EXPECT_EQ(result.discrepancies[0].origin, "po/POTFILES.in");
}

TEST_F(PotfilesCheckTest, DuplicateDeclarationLeavesOneStaleEntry) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.writeList("po/POTFILES.in", {"src/a.rs", "src/a.rs"});

    const auto result = run();
    ASSERT_EQ(result.count(DiscrepancyKind::StaleEntry), 1u);
    EXPECT_EQ(result.ofKind(DiscrepancyKind::StaleEntry)[0].path, "src/a.rs");
    EXPECT_EQ(result.count(DiscrepancyKind::OrderViolation), 0u);
}

TEST_F(PotfilesCheckTest, OrderViolationNamesTransposedPair) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/b.rs", SOURCE_MARKER);
    project.writeList("po/POTFILES.in", {"src/b.rs", "src/a.rs"});

    const auto result = run();
    ASSERT_EQ(result.discrepancies.size(), 1u);
    const auto& d = result.discrepancies[0];
    EXPECT_EQ(d.kind, DiscrepancyKind::OrderViolation);
    EXPECT_EQ(d.path, "src/b.rs");
    EXPECT_EQ(d.expected, "src/a.rs");
    EXPECT_EQ(d.line, 1u);
}

TEST_F(PotfilesCheckTest, OrderingIgnoresUncategorizedEntries) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/b.rs", SOURCE_MARKER);
    project.write("data/app.desktop.in", "Name=App\n");
    project.writeList("po/POTFILES.in", {"src/a.rs", "data/app.desktop.in", "src/b.rs"});

    EXPECT_TRUE(run().passed());
}

TEST_F(PotfilesCheckTest, OrderingRunsDespiteCrossReferenceFailure) {
    project.write("src/a.rs", SOURCE_MARKER);
    project.write("src/b.rs", SOURCE_MARKER);
    project.write("src/new.ui", UI_MARKER);
    project.writeList("po/POTFILES.in", {"src/b.rs", "src/a.rs"});

    const auto result = run();
    EXPECT_EQ(result.count(DiscrepancyKind::UndeclaredFile), 1u);
    EXPECT_EQ(result.count(DiscrepancyKind::OrderViolation), 1u);
}

TEST_F(PotfilesCheckTest, MacroUsageFailsEvenWhenDeclaredAndOrdered) {
    project.write("src/a.rs", "let s = gettext(\"x\");\nlet t = gettext!(\"Hi {}\", name);\n");
    project.writeList("po/POTFILES.in", {"src/a.rs"});

    const auto result = run();
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::DisallowedMacro);
    EXPECT_EQ(result.discrepancies[0].path, "src/a.rs");
}

TEST_F(PotfilesCheckTest, EvaluateWorksOnParsedInputs) {
    const PotfilesCheck check(cfg, project.root());
    pc::scan::ScanResult scan;
    scan.discovered[Category::Source] = {"src/a.rs", "src/c.rs"};

    const auto result = check.evaluate(parseListFile("src/a.rs\nsrc/b.rs\n", "po/POTFILES.in"),
                                       parseListFile("", "po/POTFILES.skip"), scan);
    EXPECT_EQ(result.count(DiscrepancyKind::StaleEntry), 1u);
    EXPECT_EQ(result.ofKind(DiscrepancyKind::StaleEntry)[0].path, "src/b.rs");
    EXPECT_EQ(result.count(DiscrepancyKind::UndeclaredFile), 1u);
    EXPECT_EQ(result.ofKind(DiscrepancyKind::UndeclaredFile)[0].path, "src/c.rs");
}

TEST_F(PotfilesCheckTest, ConfiguredPathsAreHonored) {
    cfg.manifest = "i18n/files.txt";
    cfg.skip = "i18n/skip.txt";
    cfg.scan_root = "lib";
    project.write("lib/a.rs", SOURCE_MARKER);
    project.write("src/ignored.rs", SOURCE_MARKER);
    project.writeList("i18n/files.txt", {"lib/a.rs"});

    const auto result = run();
    EXPECT_TRUE(result.passed());
    EXPECT_EQ(result.name, "i18n/files.txt");
}
