//! # Result Reader Tests
//!
//! End-to-end loading: XML text in, grouped `TestRun` out.

#include "xunit/reader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace testviz;
using namespace testviz::xunit;
namespace fs = std::filesystem;

using Names = std::vector<std::string>;

class ReaderTest : public ::testing::Test {
protected:
    names::NamingOptions options = names::NamingOptions::defaults();

    auto load_ok(const std::string& xml) -> TestRun {
        auto result = load(xml, options);
        if (is_err(result)) {
            ADD_FAILURE() << "unexpected error: " << unwrap_err(result).to_string();
            return {};
        }
        return unwrap(result);
    }

    static auto group_names(const std::vector<TestGroup>& groups) -> Names {
        Names names;
        for (const auto& group : groups) {
            names.push_back(group.name);
        }
        return names;
    }

    static auto test_names(const std::vector<TestCase>& tests) -> Names {
        Names names;
        for (const auto& test : tests) {
            names.push_back(test.name);
        }
        return names;
    }
};

static const char* const TRAIT_RUN =
    "<assemblies computer=\"WIN11\" user=\"Kevin\" start-rtf=\"2000-12-01\" "
    "finish-rtf=\"2001-12-01\" timestamp=\"2001-12-02\">\n"
    "  <assembly name=\"~/parent/sub/app.dll\" errors=\"1\" failed=\"2\" passed=\"3\" "
    "not-run=\"4\" total=\"5\" run-date=\"07/10/2023\" run-time=\"20:53:19\" "
    "time-rtf=\"2000-12-01\">\n"
    "    <collection>\n"
    "      <test name=\"A test with a display name.\" result=\"Pass\">\n"
    "        <traits />\n"
    "      </test>\n"
    "      <test name=\"NS1.Class.SubClass.TestClass.TestMethod\" result=\"Fail\">\n"
    "        <traits />\n"
    "      </test>\n"
    "      <test name=\"NS1.Class.SubClass.TestClass+Method+Scenario+SubScenario.Result\" "
    "result=\"Pass\">\n"
    "        <traits />\n"
    "      </test>\n"
    "      <test name=\"NS1.Class.SubClass.TestClass+Method+Scenario2+SubScenario.Result\" "
    "result=\"Pass\">\n"
    "        <traits />\n"
    "      </test>\n"
    "      <test name=\"A test with a display name (with a trait).\" result=\"Pass\">\n"
    "        <traits>\n"
    "          <trait name=\"Category\" value=\"Unit\" />\n"
    "        </traits>\n"
    "      </test>\n"
    "      <test name=\"A test with a display name (with multiple traits).\" result=\"Pass\">\n"
    "        <traits>\n"
    "          <trait name=\"Category\" value=\"Unit\" />\n"
    "          <trait name=\"Timing\" value=\"Slow\" />\n"
    "        </traits>\n"
    "      </test>\n"
    "    </collection>\n"
    "  </assembly>\n"
    "</assemblies>";

// ============================================================================
// load
// ============================================================================

TEST_F(ReaderTest, RejectsNonXml) {
    auto result = load("{}", options);
    EXPECT_TRUE(is_err(result));
}

TEST_F(ReaderTest, AssemblyWithoutTests) {
    auto run = load_ok(
        "<assemblies computer=\"WIN11\" user=\"Kevin\" start-rtf=\"2000-12-01\" "
        "finish-rtf=\"2001-12-01\" timestamp=\"2001-12-02\">\n"
        "  <assembly name=\"C:\\Parent\\Sub\\App.dll\" errors=\"1\" failed=\"2\" passed=\"3\" "
        "not-run=\"4\" total=\"5\" run-date=\"07/10/2023\" run-time=\"20:53:19\" "
        "time-rtf=\"2000-12-01\">\n"
        "  </assembly>\n"
        "</assemblies>");

    EXPECT_EQ(run.computer, "WIN11");
    EXPECT_EQ(run.user, "Kevin");
    EXPECT_EQ(run.start_time_rtf, "2000-12-01");
    EXPECT_EQ(run.end_time_rtf, "2001-12-01");
    EXPECT_EQ(run.timestamp, "2001-12-02");

    ASSERT_EQ(run.assemblies.size(), 1u);
    const auto& assembly = run.assemblies[0];
    EXPECT_EQ(assembly.name, "App.dll");
    EXPECT_EQ(assembly.error_count, 1);
    EXPECT_EQ(assembly.passed_count, 3);
    EXPECT_EQ(assembly.failed_count, 2);
    EXPECT_EQ(assembly.not_run_count, 4);
    EXPECT_EQ(assembly.total_count, 5);
    EXPECT_EQ(assembly.run_date, "07/10/2023");
    EXPECT_EQ(assembly.run_time, "20:53:19");
    EXPECT_EQ(assembly.time_rtf, "2000-12-01");
    EXPECT_TRUE(assembly.test_groups.empty());
}

TEST_F(ReaderTest, GroupsTestsByTraitAndPath) {
    auto run = load_ok(TRAIT_RUN);

    ASSERT_EQ(run.assemblies.size(), 1u);
    const auto& assembly = run.assemblies[0];
    EXPECT_EQ(assembly.name, "app.dll");
    ASSERT_EQ(group_names(assembly.test_groups), (Names{"", "Category - Unit", "Timing - Slow"}));

    // Tests without traits
    const auto& plain = assembly.test_groups[0];
    EXPECT_EQ(test_names(plain.tests), (Names{"A test with a display name.", "Test method"}));
    EXPECT_EQ(plain.tests[1].result, "Fail");

    ASSERT_EQ(group_names(plain.groups), (Names{"Test class"}));
    const auto& test_class = plain.groups[0];
    EXPECT_TRUE(test_class.tests.empty());
    ASSERT_EQ(group_names(test_class.groups), (Names{"Method"}));

    const auto& method = test_class.groups[0];
    EXPECT_TRUE(method.tests.empty());
    ASSERT_EQ(group_names(method.groups), (Names{"Scenario", "Scenario2"}));

    for (const auto& scenario : method.groups) {
        EXPECT_TRUE(scenario.tests.empty());
        ASSERT_EQ(group_names(scenario.groups), (Names{"Sub scenario"}));
        const auto& sub = scenario.groups[0];
        EXPECT_TRUE(sub.groups.empty());
        ASSERT_EQ(test_names(sub.tests), (Names{"Result"}));
        EXPECT_EQ(sub.tests[0].result, "Pass");
    }

    // Tests with traits
    const auto& unit = assembly.test_groups[1];
    EXPECT_EQ(test_names(unit.tests), (Names{"A test with a display name (with a trait).",
                                             "A test with a display name (with multiple traits)."}));
    EXPECT_TRUE(unit.groups.empty());

    const auto& slow = assembly.test_groups[2];
    EXPECT_EQ(test_names(slow.tests),
              (Names{"A test with a display name (with multiple traits)."}));
}

TEST_F(ReaderTest, TestCaseCarriesDetails) {
    auto run = load_ok(R"(<assemblies><assembly name="a.dll"><collection>
      <test name="NS.Calc+Divide.ByZero" result="Fail" time="0.25">
        <failure exception-type="System.DivideByZeroException">
          <message>Attempted to divide by zero.
Second line</message>
        </failure>
      </test>
      <test name="NS.Calc.Later" result="Skip" time="0"><reason>Not ready</reason></test>
    </collection></assembly></assemblies>)");

    const auto& root = run.assemblies[0].test_groups[0];
    ASSERT_EQ(root.tests.size(), 1u);
    EXPECT_EQ(root.tests[0].name, "Later");
    EXPECT_TRUE(root.tests[0].skipped());
    EXPECT_EQ(root.tests[0].reason, "Not ready");

    const auto& failed = root.groups[0].groups[0].tests[0];
    EXPECT_EQ(failed.name, "By zero");
    EXPECT_EQ(failed.qualified_name, "NS.Calc+Divide.ByZero");
    EXPECT_TRUE(failed.failed());
    EXPECT_DOUBLE_EQ(failed.time, 0.25);
    EXPECT_EQ(failed.failure_type, "System.DivideByZeroException");
    EXPECT_EQ(failed.failure_message, "Attempted to divide by zero.\nSecond line");
    EXPECT_EQ(failed.path, (Names{"Calc", "Divide"}));
}

TEST_F(ReaderTest, TestsFromAllCollectionsAreMerged) {
    auto run = load_ok(R"(<assemblies><assembly name="a.dll">
      <collection><test name="NS.A+Group.First" result="Pass" /></collection>
      <collection><test name="NS.A+Group.Second" result="Pass" /></collection>
    </assembly></assemblies>)");

    const auto& group = run.assemblies[0].test_groups[0].groups[0].groups[0];
    EXPECT_EQ(group.name, "Group");
    EXPECT_EQ(test_names(group.tests), (Names{"First", "Second"}));
}

TEST_F(ReaderTest, EnvironmentDetailsAreCopied) {
    auto run = load_ok(R"(<assemblies><assembly name="a.dll" environment="64-bit .NET 8.0"
        target-framework=".NETCoreApp,Version=v8.0" time="1.5">
      <errors><error type="fixture-cleanup" name="NS.Fixture" /></errors>
    </assembly></assemblies>)");

    const auto& assembly = run.assemblies[0];
    EXPECT_EQ(assembly.environment, "64-bit .NET 8.0");
    EXPECT_EQ(assembly.target_framework, ".NETCoreApp,Version=v8.0");
    EXPECT_DOUBLE_EQ(assembly.time, 1.5);
    ASSERT_EQ(assembly.environment_errors.size(), 1u);
    EXPECT_EQ(assembly.environment_errors[0].name, "NS.Fixture");
}

TEST_F(ReaderTest, NamingOptionsApplyToGroups) {
    auto run = load_ok(R"(<assemblies><assembly><collection>
      <test name="NS.DBSyncerTests+WhenStarted.ItSyncs" result="Pass" />
    </collection></assembly></assemblies>)");

    const auto& group = run.assemblies[0].test_groups[0].groups[0];
    EXPECT_EQ(group.name, "DBSyncer tests");
    EXPECT_EQ(group.groups[0].name, "When started");
    EXPECT_EQ(group.groups[0].tests[0].name, "It syncs");
}

// ============================================================================
// load_file
// ============================================================================

class LoadFileTest : public ReaderTest {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / "testviz_reader_test";
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    auto write(const std::string& name, const std::string& content) -> std::string {
        auto path = dir / name;
        std::ofstream(path) << content;
        return path.string();
    }
};

TEST_F(LoadFileTest, ReadsFile) {
    auto path = write("results.xml", TRAIT_RUN);

    auto result = load_file(path, options);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).assemblies.size(), 1u);
}

TEST_F(LoadFileTest, MissingFileIsAnError) {
    auto result = load_file((dir / "missing.xml").string(), options);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("missing.xml"), std::string::npos);
}

TEST_F(LoadFileTest, InvalidFileIsAnError) {
    auto path = write("broken.xml", "<assemblies><assembly></assemblies>");

    EXPECT_TRUE(is_err(load_file(path, options)));
}
