#include <gtest/gtest.h>
#include "check/ResourceChecks.hpp"
#include "TempProject.hpp"

using namespace pc::check;
using pc::config::ResourcesConfig;

namespace {

std::string gresource(const std::vector<std::string>& files) {
    std::string xml = "<gresources>\n  <gresource prefix=\"/org/example/App\">\n";
    for (const auto& f : files) xml += "    <file>" + f + "</file>\n";
    xml += "  </gresource>\n</gresources>\n";
    return xml;
}

}

class ResourceChecksTest : public ::testing::Test {
protected:
    TempProject project;
    ResourcesConfig cfg;
};

TEST_F(ResourceChecksTest, SortedGResourcePasses) {
    project.write(cfg.gresource, gresource({"icons/app.svg", "style.css", "ui/window.ui"}));

    const auto result = checkGResourceOrder(cfg, project.root());
    EXPECT_TRUE(result.passed());
    EXPECT_EQ(result.name, "data/resources/resources.gresource.xml");
}

TEST_F(ResourceChecksTest, GResourceReportsFirstViolation) {
    project.write(cfg.gresource, gresource({"style.css", "icons/app.svg", "ui/b.ui", "ui/a.ui"}));

    const auto result = checkGResourceOrder(cfg, project.root());
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::OrderViolation);
    EXPECT_EQ(result.discrepancies[0].path, "style.css");
    EXPECT_EQ(result.discrepancies[0].expected, "icons/app.svg");
}

TEST_F(ResourceChecksTest, MissingGResourceIsUnreadable) {
    const auto result = checkGResourceOrder(cfg, project.root());
    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.count(DiscrepancyKind::UnreadableManifest), 1u);
}

TEST_F(ResourceChecksTest, MalformedGResourceIsUnreadable) {
    project.write(cfg.gresource, "<gresources><gresource>");

    const auto result = checkGResourceOrder(cfg, project.root());
    ASSERT_EQ(result.discrepancies.size(), 1u);
    EXPECT_EQ(result.discrepancies[0].kind, DiscrepancyKind::UnreadableManifest);
    EXPECT_FALSE(result.discrepancies[0].detail.empty());
}

TEST_F(ResourceChecksTest, BlueprintListPasses) {
    project.write("src/session/view.blp", "");
    project.write("src/window.blp", "");
    project.writeList(cfg.blueprint_list, {"session/view.blp", "window.blp"});

    EXPECT_TRUE(checkBlueprintList(cfg, project.root()).passed());
}

TEST_F(ResourceChecksTest, BlueprintListMissingEntryDoesNotStopOrdering) {
    project.write("src/window.blp", "");
    project.writeList(cfg.blueprint_list, {"window.blp", "gone.blp"});

    const auto result = checkBlueprintList(cfg, project.root());
    EXPECT_FALSE(result.aborted);
    ASSERT_EQ(result.count(DiscrepancyKind::MissingFile), 1u);
    const auto missing = result.ofKind(DiscrepancyKind::MissingFile)[0];
    EXPECT_EQ(missing.path, "gone.blp");
    EXPECT_EQ(missing.line, 2u);
    ASSERT_EQ(result.count(DiscrepancyKind::OrderViolation), 1u);
    EXPECT_EQ(result.ofKind(DiscrepancyKind::OrderViolation)[0].path, "window.blp");
}

TEST_F(ResourceChecksTest, BlueprintEntriesResolveBelowBase) {
    cfg.blueprint_base = "ui";
    project.write("ui/window.blp", "");
    project.writeList(cfg.blueprint_list, {"window.blp"});

    EXPECT_TRUE(checkBlueprintList(cfg, project.root()).passed());
}
