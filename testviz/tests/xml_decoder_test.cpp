//! # xUnit XML Decoder Tests
//!
//! Attribute mapping, nesting rules, and the error cases that reject a
//! whole document.

#include "xunit/xml_decoder.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace testviz;
using namespace testviz::xunit;

class XmlDecoderTest : public ::testing::Test {
protected:
    static auto decode_ok(const std::string& xml) -> Document {
        auto result = decode(xml);
        if (is_err(result)) {
            ADD_FAILURE() << "unexpected decode error: " << unwrap_err(result).to_string();
            return {};
        }
        return unwrap(result);
    }

    static auto decode_err(const std::string& xml) -> DecodeError {
        auto result = decode(xml);
        if (is_ok(result)) {
            ADD_FAILURE() << "expected a decode error";
            return {};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Attributes
// ============================================================================

TEST_F(XmlDecoderTest, RootAttributes) {
    auto doc = decode_ok(R"(<assemblies id="run-1" schema-version="3" computer="WIN11" user="Kevin"
                                        start-rtf="2000-12-01" finish-rtf="2001-12-01"
                                        timestamp="07/10/2023 20:53:19" />)");

    EXPECT_EQ(doc.id, "run-1");
    EXPECT_EQ(doc.schema_version, "3");
    EXPECT_EQ(doc.computer, "WIN11");
    EXPECT_EQ(doc.user, "Kevin");
    EXPECT_EQ(doc.start_rtf, "2000-12-01");
    EXPECT_EQ(doc.finish_rtf, "2001-12-01");
    EXPECT_EQ(doc.timestamp, "07/10/2023 20:53:19");
    EXPECT_TRUE(doc.assemblies.empty());
}

TEST_F(XmlDecoderTest, AssemblyAttributes) {
    auto doc = decode_ok(R"(<?xml version="1.0" encoding="utf-8"?>
<assemblies>
  <assembly name="C:\Parent\Sub\App.dll" config-file="App.dll.config" environment="64-bit .NET 8.0"
            test-framework="xUnit.net 2.5.0" target-framework=".NETCoreApp,Version=v8.0"
            errors="1" failed="2" passed="3" not-run="4" skipped="5" total="15"
            run-date="2023-07-10" run-time="20:53:19" time="1.250" time-rtf="00:00:01.2500000"
            start-rtf="2023-07-10T20:53:19" finish-rtf="2023-07-10T20:53:20" id="asm-1" />
</assemblies>)");

    ASSERT_EQ(doc.assemblies.size(), 1u);
    const auto& assembly = doc.assemblies[0];
    EXPECT_EQ(assembly.id, "asm-1");
    EXPECT_EQ(assembly.name, "C:\\Parent\\Sub\\App.dll");
    EXPECT_EQ(assembly.config_file, "App.dll.config");
    EXPECT_EQ(assembly.environment, "64-bit .NET 8.0");
    EXPECT_EQ(assembly.test_framework, "xUnit.net 2.5.0");
    EXPECT_EQ(assembly.target_framework, ".NETCoreApp,Version=v8.0");
    EXPECT_EQ(assembly.errors, 1);
    EXPECT_EQ(assembly.failed, 2);
    EXPECT_EQ(assembly.passed, 3);
    EXPECT_EQ(assembly.not_run, 4);
    EXPECT_EQ(assembly.skipped, 5);
    EXPECT_EQ(assembly.total, 15);
    EXPECT_EQ(assembly.run_date, "2023-07-10");
    EXPECT_EQ(assembly.run_time, "20:53:19");
    EXPECT_DOUBLE_EQ(assembly.time, 1.25);
    EXPECT_EQ(assembly.time_rtf, "00:00:01.2500000");
    EXPECT_EQ(assembly.start_rtf, "2023-07-10T20:53:19");
    EXPECT_EQ(assembly.finish_rtf, "2023-07-10T20:53:20");
}

TEST_F(XmlDecoderTest, MissingNumbersReadAsZero) {
    auto doc = decode_ok(R"(<assemblies><assembly name="a.dll"/></assemblies>)");

    ASSERT_EQ(doc.assemblies.size(), 1u);
    EXPECT_EQ(doc.assemblies[0].total, 0);
    EXPECT_EQ(doc.assemblies[0].failed, 0);
    EXPECT_DOUBLE_EQ(doc.assemblies[0].time, 0.0);
}

TEST_F(XmlDecoderTest, NumbersAreTrimmed) {
    auto doc = decode_ok(R"(<assemblies><assembly total=" 12 " time=" 0.5 "/></assemblies>)");

    EXPECT_EQ(doc.assemblies[0].total, 12);
    EXPECT_DOUBLE_EQ(doc.assemblies[0].time, 0.5);
}

// ============================================================================
// Tests and Their Children
// ============================================================================

TEST_F(XmlDecoderTest, CollectionAndTest) {
    auto doc = decode_ok(R"(<assemblies>
  <assembly name="a.dll">
    <collection id="c1" name="Test collection for NS.Tests" total="1" passed="0" failed="1"
                skipped="0" not-run="0" time="0.012" time-rtf="00:00:00.0120000">
      <test id="t1" name="NS.Tests.Divides" type="NS.Tests" method="Divides" result="Fail"
            time="0.0105" time-rtf="00:00:00.0105000" source-file="Tests.cs" source-line="42">
        <traits>
          <trait name="Category" value="Unit" />
          <trait name="Owner" value="Core" />
        </traits>
        <failure exception-type="System.DivideByZeroException">
          <message><![CDATA[Attempted to divide by zero.]]></message>
          <stack-trace>   at NS.Tests.Divides() in Tests.cs:line 42</stack-trace>
        </failure>
        <output>some output &amp; more</output>
        <warnings>
          <warning>first</warning>
          <warning>second</warning>
        </warnings>
      </test>
    </collection>
  </assembly>
</assemblies>)");

    ASSERT_EQ(doc.assemblies.size(), 1u);
    ASSERT_EQ(doc.assemblies[0].collections.size(), 1u);
    const auto& collection = doc.assemblies[0].collections[0];
    EXPECT_EQ(collection.id, "c1");
    EXPECT_EQ(collection.name, "Test collection for NS.Tests");
    EXPECT_EQ(collection.total, 1);
    EXPECT_EQ(collection.failed, 1);
    EXPECT_EQ(collection.time, "0.012");
    EXPECT_EQ(collection.time_rtf, "00:00:00.0120000");

    ASSERT_EQ(collection.tests.size(), 1u);
    const auto& test = collection.tests[0];
    EXPECT_EQ(test.id, "t1");
    EXPECT_EQ(test.name, "NS.Tests.Divides");
    EXPECT_EQ(test.type, "NS.Tests");
    EXPECT_EQ(test.method, "Divides");
    EXPECT_EQ(test.result, "Fail");
    EXPECT_DOUBLE_EQ(test.time, 0.0105);
    EXPECT_EQ(test.time_rtf, "00:00:00.0105000");
    EXPECT_EQ(test.source_file, "Tests.cs");
    EXPECT_EQ(test.source_line, "42");

    ASSERT_EQ(test.traits.size(), 2u);
    EXPECT_EQ(test.traits[0].name, "Category");
    EXPECT_EQ(test.traits[0].value, "Unit");
    EXPECT_EQ(test.traits[1].name, "Owner");
    EXPECT_EQ(test.traits[1].value, "Core");

    EXPECT_EQ(test.failure.exception_type, "System.DivideByZeroException");
    EXPECT_EQ(test.failure.message, "Attempted to divide by zero.");
    EXPECT_EQ(test.failure.stack_trace, "   at NS.Tests.Divides() in Tests.cs:line 42");
    EXPECT_EQ(test.output, "some output & more");
    ASSERT_EQ(test.warnings.size(), 2u);
    EXPECT_EQ(test.warnings[1], "second");
}

TEST_F(XmlDecoderTest, SkippedTestReason) {
    auto doc = decode_ok(R"(<assemblies><assembly><collection>
      <test name="NS.Tests.Later" result="Skip" time="0"><reason>Not ready</reason></test>
    </collection></assembly></assemblies>)");

    const auto& test = doc.assemblies[0].collections[0].tests[0];
    EXPECT_EQ(test.result, "Skip");
    EXPECT_EQ(test.reason, "Not ready");
}

TEST_F(XmlDecoderTest, EnvironmentErrors) {
    auto doc = decode_ok(R"(<assemblies><assembly name="a.dll">
      <errors>
        <error type="fixture-cleanup" name="NS.DatabaseFixture" />
        <error type="assembly-cleanup" name="a.dll" />
      </errors>
    </assembly></assemblies>)");

    const auto& errors = doc.assemblies[0].environment_errors;
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].name, "NS.DatabaseFixture");
    EXPECT_EQ(errors[0].type, "fixture-cleanup");
    EXPECT_EQ(errors[1].type, "assembly-cleanup");
}

TEST_F(XmlDecoderTest, ElementsOutsideTheirParentAreIgnored) {
    auto doc = decode_ok(R"(<assemblies>
  <test name="Stray" />
  <assembly name="a.dll">
    <test name="AlsoStray" />
    <collection>
      <trait name="NotInTraits" value="x" />
      <test name="NS.Kept" result="Pass" />
    </collection>
  </assembly>
</assemblies>)");

    ASSERT_EQ(doc.assemblies.size(), 1u);
    ASSERT_EQ(doc.assemblies[0].collections.size(), 1u);
    const auto& tests = doc.assemblies[0].collections[0].tests;
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests[0].name, "NS.Kept");
    EXPECT_TRUE(tests[0].traits.empty());
}

TEST_F(XmlDecoderTest, UnknownElementsAndAttributesAreIgnored) {
    auto doc = decode_ok(R"(<assemblies extra="1"><assembly name="a.dll" flavor="x">
      <unknown><collection><test name="Hidden"/></collection></unknown>
    </assembly></assemblies>)");

    ASSERT_EQ(doc.assemblies.size(), 1u);
    EXPECT_TRUE(doc.assemblies[0].collections.empty());
}

TEST_F(XmlDecoderTest, SeveralAssemblies) {
    auto doc = decode_ok(
        R"(<assemblies><assembly name="a.dll"/><assembly name="b.dll"></assembly></assemblies>)");

    ASSERT_EQ(doc.assemblies.size(), 2u);
    EXPECT_EQ(doc.assemblies[0].name, "a.dll");
    EXPECT_EQ(doc.assemblies[1].name, "b.dll");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(XmlDecoderTest, JsonIsRejected) {
    auto error = decode_err("{}");
    EXPECT_FALSE(error.message.empty());
}

TEST_F(XmlDecoderTest, EmptyInputIsRejected) {
    decode_err("");
}

TEST_F(XmlDecoderTest, MalformedXmlIsRejected) {
    auto error = decode_err("<assemblies>\n  <assembly>\n</assemblies>");
    EXPECT_FALSE(error.message.empty());
}

TEST_F(XmlDecoderTest, ForeignRootIsRejected) {
    auto error = decode_err("<testsuites><testsuite/></testsuites>");
    EXPECT_NE(error.message.find("<assemblies>"), std::string::npos);
    EXPECT_NE(error.message.find("testsuites"), std::string::npos);
}

TEST_F(XmlDecoderTest, BadIntegerIsRejectedWithLine) {
    auto error = decode_err("<assemblies>\n  <assembly total=\"many\" />\n</assemblies>");
    EXPECT_NE(error.message.find("many"), std::string::npos);
    EXPECT_NE(error.message.find("total"), std::string::npos);
    EXPECT_EQ(error.line, 2);
    EXPECT_NE(error.to_string().find("(line 2)"), std::string::npos);
}

TEST_F(XmlDecoderTest, BadTimeIsRejected) {
    auto error = decode_err(R"(<assemblies><assembly><collection>
      <test name="x" time="fast" />
    </collection></assembly></assemblies>)");
    EXPECT_NE(error.message.find("time"), std::string::npos);
}

// ============================================================================
// Attribute Parsing
// ============================================================================

TEST(AttributeParseTest, Integers) {
    int value = -1;
    EXPECT_TRUE(parse_int_attribute("", value));
    EXPECT_EQ(value, 0);
    EXPECT_TRUE(parse_int_attribute("  42\n", value));
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(parse_int_attribute("+7", value));
    EXPECT_EQ(value, 7);
    EXPECT_TRUE(parse_int_attribute("-3", value));
    EXPECT_EQ(value, -3);
    EXPECT_FALSE(parse_int_attribute("4.5", value));
    EXPECT_FALSE(parse_int_attribute("12abc", value));
    EXPECT_FALSE(parse_int_attribute("99999999999999999999", value));
}

TEST(AttributeParseTest, Doubles) {
    double value = -1.0;
    EXPECT_TRUE(parse_double_attribute(" ", value));
    EXPECT_DOUBLE_EQ(value, 0.0);
    EXPECT_TRUE(parse_double_attribute("0.0105", value));
    EXPECT_DOUBLE_EQ(value, 0.0105);
    EXPECT_TRUE(parse_double_attribute("3", value));
    EXPECT_DOUBLE_EQ(value, 3.0);
    EXPECT_FALSE(parse_double_attribute("1.2s", value));
}
