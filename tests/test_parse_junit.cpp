#include "test_common.h"

#include "patchbench/parsers.h"
#include "patchbench/report.h"

using namespace patchbench;

static const TestCase* find_case(const TestReport& r, const std::string& name) {
    for (const auto& t : r.tests) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

int main() {
    // Surefire-style single suite
    const std::string surefire =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<testsuite name=\"com.acme.CalcTest\" tests=\"4\" failures=\"1\" errors=\"1\" skipped=\"1\" time=\"0.5\">\n"
        "  <testcase name=\"adds\" classname=\"com.acme.CalcTest\" time=\"0.1\"/>\n"
        "  <testcase name=\"divides\" classname=\"com.acme.CalcTest\" time=\"0.2\">\n"
        "    <failure message=\"expected 2 but was 3\" type=\"AssertionError\">at CalcTest.java:10</failure>\n"
        "  </testcase>\n"
        "  <testcase name=\"parses\" classname=\"com.acme.CalcTest\">\n"
        "    <error type=\"NullPointerException\"><![CDATA[java.lang.NullPointerException\n  at x]]></error>\n"
        "  </testcase>\n"
        "  <testcase name=\"todo\" classname=\"com.acme.CalcTest\"><skipped/></testcase>\n"
        "</testsuite>\n";
    auto r = parse_junit_xml(surefire);
    expect_eq_ll(r.summary.total, 4, "surefire total");
    expect_eq_ll(r.summary.passed, 1, "surefire passed");
    expect_eq_ll(r.summary.failed, 1, "surefire failed");
    expect_eq_ll(r.summary.errors, 1, "surefire errors");
    expect_eq_ll(r.summary.skipped, 1, "surefire skipped");
    expect_true(r.status == ReportStatus::FAILED, "surefire status");
    const TestCase* div = find_case(r, "divides");
    expect_true(div && div->status == TestStatus::FAILED, "divides failed");
    expect_eq_str(div->message, "expected 2 but was 3", "failure message");
    expect_eq_str(div->details, "at CalcTest.java:10", "failure details");
    const TestCase* parses = find_case(r, "parses");
    expect_true(parses && parses->status == TestStatus::ERROR, "parses error");
    expect_eq_str(parses->message, "NullPointerException", "error message falls back to type");
    expect_true(parses->details.find("NullPointerException") != std::string::npos, "cdata details");
    expect_eq_str(qualified_name(*find_case(r, "adds")), "com.acme.CalcTest.adds", "classname kept");

    // <testsuites> with several suites: attributes summed across suites
    const std::string multi =
        "<testsuites>\n"
        "  <testsuite name=\"a\" tests=\"2\" failures=\"0\" errors=\"0\">\n"
        "    <testcase name=\"t1\"/><testcase name=\"t2\"/>\n"
        "  </testsuite>\n"
        "  <testsuite name=\"b\" tests=\"3\" failures=\"1\" errors=\"0\" skipped=\"0\">\n"
        "    <testcase name=\"t3\"/><testcase name=\"t4\"><failure/></testcase><testcase name=\"t5\"/>\n"
        "  </testsuite>\n"
        "</testsuites>\n";
    auto m = parse_junit_xml(multi);
    expect_eq_ll(m.summary.total, 5, "multi total");
    expect_eq_ll(m.summary.passed, 4, "multi passed = total - failed - errors - skipped");
    expect_eq_ll(m.summary.failed, 1, "multi failed");
    expect_eq_str(find_case(m, "t1")->classname, "a", "missing classname takes suite name");

    // Nested suites (PHPUnit) are counted once, at the outermost level
    const std::string nested =
        "<testsuites>\n"
        "  <testsuite name=\"All\" tests=\"3\" failures=\"1\" errors=\"0\" skipped=\"0\">\n"
        "    <testsuite name=\"Unit\" tests=\"3\" failures=\"1\" errors=\"0\" skipped=\"0\">\n"
        "      <testcase name=\"testA\" class=\"UnitTest\"/>\n"
        "      <testcase name=\"testB\"><failure type=\"PHPUnit\\Framework\\ExpectationFailedException\"/></testcase>\n"
        "      <testcase name=\"testC\"/>\n"
        "    </testsuite>\n"
        "  </testsuite>\n"
        "</testsuites>\n";
    auto n = parse_junit_xml(nested);
    expect_eq_ll(n.summary.total, 3, "nested counted once");
    expect_eq_ll((long long)n.tests.size(), 3, "nested cases collected");
    expect_true(n.status == ReportStatus::FAILED, "nested status");

    // No count attributes: derived from the cases
    const std::string bare =
        "<testsuite name=\"s\">"
        "<testcase name=\"x\"/><testcase name=\"y\"><skipped message=\"later\"/></testcase>"
        "</testsuite>";
    auto b = parse_junit_xml(bare);
    expect_eq_ll(b.summary.total, 2, "bare total");
    expect_eq_ll(b.summary.skipped, 1, "bare skipped");
    expect_true(b.status == ReportStatus::PASSED, "bare status passed");
    expect_eq_str(find_case(b, "y")->message, "later", "skip message");

    // gtest XML marks disabled tests with status="notrun"
    const std::string gtest_xml =
        "<testsuites tests=\"2\" failures=\"0\" disabled=\"1\" errors=\"0\">"
        "<testsuite name=\"Math\" tests=\"2\" failures=\"0\" disabled=\"1\" errors=\"0\">"
        "<testcase name=\"Add\" status=\"run\" result=\"completed\" time=\"0.001\" classname=\"Math\"/>"
        "<testcase name=\"DISABLED_Sub\" status=\"notrun\" result=\"suppressed\" time=\"0\" classname=\"Math\"/>"
        "</testsuite></testsuites>";
    auto g = parse_junit_xml(gtest_xml);
    expect_eq_ll(g.summary.total, 2, "gtest xml total");
    expect_eq_ll(g.summary.skipped, 1, "disabled counted as skipped");
    expect_eq_ll(g.summary.passed, 1, "gtest xml passed");

    // Empty suite is no evidence
    auto e = parse_junit_xml("<testsuite name=\"empty\" tests=\"0\"/>");
    expect_true(e.status == ReportStatus::UNKNOWN, "empty suite unknown");

    // Malformed XML degrades to unknown instead of throwing
    auto bad = parse_junit_xml("<testsuite name=\"x\"><testcase name=\"a\"></testsuite>");
    expect_true(bad.status == ReportStatus::UNKNOWN, "malformed xml unknown");
    expect_true(parse_junit_xml("").status == ReportStatus::UNKNOWN, "empty input unknown");

    // CTest dashboard Test.xml
    const std::string ctest =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<Site BuildName=\"Linux\" Name=\"host\">\n"
        " <Testing>\n"
        "  <TestList><Test>./t_ok</Test><Test>./t_bad</Test><Test>./t_off</Test><Test>./t_never</Test></TestList>\n"
        "  <Test Status=\"passed\"><Name>t_ok</Name><Results>\n"
        "   <NamedMeasurement type=\"numeric/double\" name=\"Execution Time\"><Value>0.25</Value></NamedMeasurement>\n"
        "   <Measurement><Value>all good</Value></Measurement>\n"
        "  </Results></Test>\n"
        "  <Test Status=\"failed\"><Name>t_bad</Name><Results>\n"
        "   <NamedMeasurement type=\"text/string\" name=\"Exit Value\"><Value>1</Value></NamedMeasurement>\n"
        "   <NamedMeasurement type=\"text/string\" name=\"Completion Status\"><Value>Completed</Value></NamedMeasurement>\n"
        "   <Measurement><Value>assert x == y</Value></Measurement>\n"
        "  </Results></Test>\n"
        "  <Test Status=\"notrun\"><Name>t_off</Name><Results>\n"
        "   <NamedMeasurement type=\"text/string\" name=\"Completion Status\"><Value>Disabled</Value></NamedMeasurement>\n"
        "  </Results></Test>\n"
        " </Testing>\n"
        "</Site>\n";
    auto c = parse_xml_report(ctest);
    expect_eq_ll(c.summary.total, 3, "ctest total");
    expect_eq_ll(c.summary.passed, 1, "ctest passed");
    expect_eq_ll(c.summary.failed, 1, "ctest failed");
    expect_eq_ll(c.summary.skipped, 1, "ctest disabled -> skipped");
    expect_eq_ll(c.summary.collected, 4, "ctest TestList is collected");
    const TestCase* bad_case = find_case(c, "t_bad");
    expect_eq_str(bad_case->message, "exit value 1", "ctest exit value message");
    expect_eq_str(bad_case->details, "assert x == y", "ctest output as details");
    expect_true(find_case(c, "t_ok")->details.empty(), "passing test has no details");
    expect_true(find_case(c, "t_ok")->time > 0.2, "ctest execution time");

    // Dispatch by root element
    expect_eq_ll(parse_xml_report(surefire).summary.total, 4, "xml dispatch junit");
    expect_true(parse_xml_report("<project/>").status == ReportStatus::UNKNOWN, "unknown root");

    std::cerr << "test_parse_junit: ALL PASSED" << std::endl;
    return 0;
}
