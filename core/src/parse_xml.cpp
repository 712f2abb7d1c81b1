#include "patchbench/parsers.h"
#include "patchbench/log.h"
#include "patchbench/report.h"
#include "parse_util.h"

#include <rapidxml.hpp>

#include <cstring>
#include <vector>

namespace patchbench {

namespace pu = parse_util;
using XmlNode = rapidxml::xml_node<char>;

namespace {

bool name_is(const XmlNode* n, const char* name) {
    return n && n->type() == rapidxml::node_element &&
           std::strlen(name) == n->name_size() &&
           std::strncmp(n->name(), name, n->name_size()) == 0;
}

std::string attr(const XmlNode* n, const char* name) {
    const auto* a = n->first_attribute(name);
    if (!a) return {};
    return std::string(a->value(), a->value_size());
}

bool has_attr(const XmlNode* n, const char* name) {
    return n->first_attribute(name) != nullptr;
}

// Concatenated character data (plain text and CDATA) directly under n.
std::string text_of(const XmlNode* n) {
    std::string out;
    for (const XmlNode* c = n->first_node(); c; c = c->next_sibling()) {
        if (c->type() == rapidxml::node_data || c->type() == rapidxml::node_cdata) {
            out.append(c->value(), c->value_size());
        }
    }
    return out;
}

const XmlNode* first_element(const XmlNode* n, const char* name) {
    for (const XmlNode* c = n->first_node(); c; c = c->next_sibling()) {
        if (name_is(c, name)) return c;
    }
    return nullptr;
}

// rapidxml parses in place and needs a mutable, NUL-terminated buffer
// that outlives the document.
struct XmlBuffer {
    std::vector<char> bytes;
    rapidxml::xml_document<char> doc;

    bool load(const std::string& xml) {
        std::string clean = pu::strip_bom(xml);
        bytes.assign(clean.begin(), clean.end());
        bytes.push_back('\0');
        try {
            doc.parse<rapidxml::parse_default>(bytes.data());
        } catch (const rapidxml::parse_error& e) {
            console_line(std::string("[report] malformed XML report: ") + e.what());
            return false;
        }
        return true;
    }

    const XmlNode* root() const {
        for (const XmlNode* c = doc.first_node(); c; c = c->next_sibling()) {
            if (c->type() == rapidxml::node_element) return c;
        }
        return nullptr;
    }
};

TestCase junit_case(const XmlNode* tc, const std::string& suite_name) {
    TestCase t;
    t.name = attr(tc, "name");
    t.classname = attr(tc, "classname");
    if (t.classname.empty()) t.classname = suite_name;
    t.time = pu::to_seconds(attr(tc, "time"));
    t.status = TestStatus::PASSED;

    const std::string run_status = attr(tc, "status");
    if (run_status == "notrun" || attr(tc, "result") == "suppressed") {
        t.status = TestStatus::SKIPPED;
    }
    for (const XmlNode* c = tc->first_node(); c; c = c->next_sibling()) {
        if (name_is(c, "failure")) {
            t.status = TestStatus::FAILED;
        } else if (name_is(c, "error")) {
            t.status = TestStatus::ERROR;
        } else if (name_is(c, "skipped")) {
            t.status = TestStatus::SKIPPED;
        } else {
            continue;
        }
        t.message = attr(c, "message");
        if (t.message.empty()) t.message = attr(c, "type");
        t.details = pu::cap_details(pu::trim(text_of(c)));
        break;
    }
    return t;
}

void collect_cases(const XmlNode* suite, std::vector<TestCase>& out) {
    const std::string suite_name = attr(suite, "name");
    for (const XmlNode* c = suite->first_node(); c; c = c->next_sibling()) {
        if (name_is(c, "testcase")) out.push_back(junit_case(c, suite_name));
        else if (name_is(c, "testsuite")) collect_cases(c, out);
    }
}

// Aggregate counts of one outermost suite. Nested suites (PHPUnit) are
// already included in their parent's attributes and are not added again.
TestSummary suite_counts(const XmlNode* suite, const std::vector<TestCase>& cases) {
    TestSummary s;
    if (!has_attr(suite, "tests")) {
        s = report_from_tests(cases).summary;
        s.collected = 0;
        return s;
    }
    s.total = pu::to_i64(attr(suite, "tests"));
    s.failed = pu::to_i64(attr(suite, "failures"));
    s.errors = pu::to_i64(attr(suite, "errors"));
    s.skipped = pu::to_i64(attr(suite, "skipped"));
    if (!has_attr(suite, "skipped")) s.skipped = pu::to_i64(attr(suite, "skip"));
    s.skipped += pu::to_i64(attr(suite, "disabled"));
    s.passed = s.total - s.failed - s.errors - s.skipped;
    return s;
}

} // namespace

TestReport parse_junit_xml(const std::string& xml) {
    XmlBuffer buf;
    if (!buf.load(xml)) return unknown_report();
    const XmlNode* root = buf.root();
    if (!root) return unknown_report();

    std::vector<const XmlNode*> suites;
    if (name_is(root, "testsuite")) {
        suites.push_back(root);
    } else if (name_is(root, "testsuites")) {
        for (const XmlNode* c = root->first_node(); c; c = c->next_sibling()) {
            if (name_is(c, "testsuite")) suites.push_back(c);
        }
    } else {
        return unknown_report();
    }

    TestReport r;
    for (const XmlNode* suite : suites) {
        std::vector<TestCase> cases;
        collect_cases(suite, cases);
        TestSummary s = suite_counts(suite, cases);
        r.summary.total += s.total;
        r.summary.passed += s.passed;
        r.summary.failed += s.failed;
        r.summary.errors += s.errors;
        r.summary.skipped += s.skipped;
        r.tests.insert(r.tests.end(), cases.begin(), cases.end());
    }
    // A <testsuites> root with its own totals but no suite children.
    if (suites.empty() && has_attr(root, "tests")) {
        r.summary = suite_counts(root, r.tests);
    }
    finalize_report(r);
    return r;
}

TestReport parse_ctest_xml(const std::string& xml) {
    XmlBuffer buf;
    if (!buf.load(xml)) return unknown_report();
    const XmlNode* root = buf.root();
    if (!name_is(root, "Site")) return unknown_report();
    const XmlNode* testing = first_element(root, "Testing");
    if (!testing) return unknown_report();

    int64_t listed = 0;
    if (const XmlNode* list = first_element(testing, "TestList")) {
        for (const XmlNode* c = list->first_node(); c; c = c->next_sibling()) {
            if (name_is(c, "Test")) listed++;
        }
    }

    std::vector<TestCase> tests;
    for (const XmlNode* c = testing->first_node(); c; c = c->next_sibling()) {
        if (!name_is(c, "Test") || !has_attr(c, "Status")) continue;
        TestCase t;
        if (const XmlNode* n = first_element(c, "Name")) t.name = pu::trim(text_of(n));

        std::string completion;
        std::string exit_value;
        if (const XmlNode* results = first_element(c, "Results")) {
            for (const XmlNode* m = results->first_node(); m; m = m->next_sibling()) {
                const XmlNode* value = first_element(m, "Value");
                if (!value) continue;
                if (name_is(m, "NamedMeasurement")) {
                    const std::string mname = attr(m, "name");
                    if (mname == "Execution Time") t.time = pu::to_seconds(text_of(value));
                    else if (mname == "Completion Status") completion = pu::trim(text_of(value));
                    else if (mname == "Exit Value") exit_value = pu::trim(text_of(value));
                } else if (name_is(m, "Measurement")) {
                    t.details = text_of(value);
                }
            }
        }

        const std::string status = attr(c, "Status");
        if (status == "passed") {
            t.status = TestStatus::PASSED;
        } else if (status == "failed") {
            t.status = TestStatus::FAILED;
            t.message = exit_value.empty() ? completion : "exit value " + exit_value;
        } else if (completion == "Disabled") {
            t.status = TestStatus::SKIPPED;
            t.message = completion;
        } else {
            t.status = TestStatus::ERROR;
            t.message = completion.empty() ? status : completion;
        }
        if (t.status == TestStatus::PASSED) t.details.clear();
        t.details = pu::cap_details(pu::trim(t.details));
        tests.push_back(std::move(t));
    }
    return report_from_tests(std::move(tests), listed);
}

TestReport parse_xml_report(const std::string& xml) {
    XmlBuffer buf;
    if (!buf.load(xml)) return unknown_report();
    const XmlNode* root = buf.root();
    if (name_is(root, "Site")) return parse_ctest_xml(xml);
    if (name_is(root, "testsuites") || name_is(root, "testsuite")) return parse_junit_xml(xml);
    return unknown_report();
}

} // namespace patchbench
