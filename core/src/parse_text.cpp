#include "patchbench/parsers.h"
#include "patchbench/report.h"
#include "parse_util.h"

#include <algorithm>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace patchbench {

namespace pu = parse_util;

namespace {

// Result of scanning console output: an optional aggregate summary plus
// whatever per-test lines were recognised.
struct ConsoleScan {
    bool have_summary{false};
    TestSummary summary;
    std::vector<TestCase> tests;
    std::map<std::string, size_t> index; // qualified name -> position in tests
    int64_t collected{0};

    // Per-test lines may repeat (verbose line + short summary); last one wins.
    void put(TestCase t) {
        const std::string key = qualified_name(t);
        auto it = index.find(key);
        if (it != index.end()) {
            tests[it->second] = std::move(t);
            return;
        }
        index.emplace(key, tests.size());
        tests.push_back(std::move(t));
    }

    TestReport to_report() {
        if (!have_summary) return report_from_tests(std::move(tests), collected);
        TestReport r;
        r.summary = summary;
        r.summary.collected = std::max(r.summary.collected, collected);
        r.tests = std::move(tests);
        finalize_report(r);
        return r;
    }
};

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

int64_t num(const std::ssub_match& m) {
    return m.matched ? pu::to_i64(m.str()) : 0;
}

TestCase make_case(const std::string& name, const std::string& classname, TestStatus st, double time = 0.0) {
    TestCase t;
    t.name = name;
    t.classname = classname;
    t.status = st;
    t.time = time;
    return t;
}

// ---- pytest ----

ConsoleScan scan_pytest(const std::vector<std::string>& lines) {
    static const std::regex summary_re(R"(^[= ]*((?:\d+ [a-z]+,? ?)+) in [0-9.]+s)");
    static const std::regex count_re(R"((\d+) (passed|failed|skipped|errors?|xfailed|xpassed))");
    static const std::regex short_re(R"(^(PASSED|FAILED|ERROR|XFAIL|XPASS) (\S+)(?: - (.*))?$)");
    static const std::regex verbose_re(R"(^(\S+::\S+) (PASSED|FAILED|ERROR|SKIPPED|XFAIL|XPASS)\b)");
    static const std::regex collected_re(R"(collected (\d+) items?)");

    ConsoleScan sc;
    auto status_of = [](const std::string& word) {
        if (word == "PASSED") return TestStatus::PASSED;
        if (word == "FAILED" || word == "XPASS") return TestStatus::FAILED;
        if (word == "ERROR") return TestStatus::ERROR;
        return TestStatus::SKIPPED;
    };

    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "collected") && std::regex_search(line, m, collected_re)) {
            sc.collected = num(m[1]);
            continue;
        }
        if (contains(line, " in ") && std::regex_search(line, m, summary_re)) {
            TestSummary s;
            const std::string counts = m[1].str();
            for (std::sregex_iterator it(counts.begin(), counts.end(), count_re), end; it != end; ++it) {
                const int64_t n = pu::to_i64((*it)[1].str());
                const std::string kind = (*it)[2].str();
                if (kind == "passed") s.passed += n;
                else if (kind == "failed" || kind == "xpassed") s.failed += n;
                else if (kind == "skipped" || kind == "xfailed") s.skipped += n;
                else s.errors += n;
            }
            sc.summary = s;
            sc.have_summary = true;
            continue;
        }
        if (std::regex_search(line, m, short_re)) {
            TestCase t = make_case(m[2].str(), "", status_of(m[1].str()));
            if (m[3].matched) t.message = m[3].str();
            sc.put(std::move(t));
        } else if (contains(line, "::") && std::regex_search(line, m, verbose_re)) {
            sc.put(make_case(m[1].str(), "", status_of(m[2].str())));
        }
    }
    return sc;
}

// ---- cargo test ----

ConsoleScan scan_cargo(const std::vector<std::string>& lines) {
    static const std::regex result_re(
        R"(test result: (?:ok|FAILED)\. (\d+) passed; (\d+) failed; (\d+) ignored)");
    static const std::regex test_re(R"(^test (.+?) \.\.\. (ok|FAILED|ignored))");
    static const std::regex running_re(R"(^running (\d+) tests?)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "test result:") && std::regex_search(line, m, result_re)) {
            sc.summary.passed += num(m[1]);
            sc.summary.failed += num(m[2]);
            sc.summary.skipped += num(m[3]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, test_re)) {
            const std::string word = m[2].str();
            TestStatus st = word == "ok" ? TestStatus::PASSED
                          : word == "FAILED" ? TestStatus::FAILED : TestStatus::SKIPPED;
            sc.put(make_case(m[1].str(), "", st));
        } else if (std::regex_search(line, m, running_re)) {
            sc.collected += num(m[1]);
        }
    }
    return sc;
}

// ---- jest (console reporter) ----

ConsoleScan scan_jest(const std::vector<std::string>& lines) {
    static const std::regex tests_re(R"(^Tests:\s+(.*?)(\d+) total)");
    static const std::regex count_re(R"((\d+) (failed|skipped|todo|passed))");
    static const std::regex case_re(R"(^\s*(✓|√|✕|×|○)\s+(?:(skipped|todo) )?(.+?)(?: \((\d+(?:\.\d+)?) ?ms\))?$)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "Tests:") && std::regex_search(line, m, tests_re)) {
            TestSummary s;
            s.total = num(m[2]);
            const std::string counts = m[1].str();
            for (std::sregex_iterator it(counts.begin(), counts.end(), count_re), end; it != end; ++it) {
                const int64_t n = pu::to_i64((*it)[1].str());
                const std::string kind = (*it)[2].str();
                if (kind == "passed") s.passed += n;
                else if (kind == "failed") s.failed += n;
                else s.skipped += n;
            }
            sc.summary = s;
            sc.have_summary = true;
        } else if (std::regex_search(line, m, case_re)) {
            const std::string mark = m[1].str();
            TestStatus st = (mark == "✓" || mark == "√") ? TestStatus::PASSED
                          : mark == "○" ? TestStatus::SKIPPED : TestStatus::FAILED;
            sc.put(make_case(m[3].str(), "", st, m[4].matched ? pu::to_seconds(m[4].str()) / 1000.0 : 0.0));
        }
    }
    return sc;
}

// ---- mocha (spec reporter) ----

ConsoleScan scan_mocha(const std::vector<std::string>& lines) {
    static const std::regex passing_re(R"(^\s*(\d+) passing)");
    static const std::regex failing_re(R"(^\s*(\d+) failing)");
    static const std::regex pending_re(R"(^\s*(\d+) pending)");
    static const std::regex pass_re(R"(^\s*(?:✓|✔|√)\s+(.+?)(?: \((\d+)ms\))?$)");
    static const std::regex fail_re(R"(^\s*(\d+)\) (.+)$)");

    ConsoleScan sc;
    bool in_failure_listing = false;
    std::smatch m;
    for (const auto& line : lines) {
        if (std::regex_search(line, m, passing_re)) {
            sc.summary.passed = num(m[1]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, failing_re)) {
            sc.summary.failed = num(m[1]);
            sc.have_summary = true;
            in_failure_listing = true; // numbered entries below repeat the failures
        } else if (std::regex_search(line, m, pending_re)) {
            sc.summary.skipped = num(m[1]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, pass_re)) {
            sc.put(make_case(m[1].str(), "", TestStatus::PASSED,
                             m[2].matched ? pu::to_seconds(m[2].str()) / 1000.0 : 0.0));
        } else if (!in_failure_listing && std::regex_search(line, m, fail_re)) {
            sc.put(make_case(m[2].str(), "", TestStatus::FAILED));
        }
    }
    return sc;
}

// ---- gradle ----

ConsoleScan scan_gradle(const std::vector<std::string>& lines) {
    static const std::regex summary_re(R"((\d+) tests? completed(?:, (\d+) failed)?(?:, (\d+) skipped)?)");
    static const std::regex case_re(R"(^(\S+) > (.+) (PASSED|FAILED|SKIPPED)$)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "completed") && std::regex_search(line, m, summary_re)) {
            // one line per test task in multi-project builds
            sc.summary.total += num(m[1]);
            sc.summary.failed += num(m[2]);
            sc.summary.skipped += num(m[3]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, case_re)) {
            const std::string word = m[3].str();
            TestStatus st = word == "PASSED" ? TestStatus::PASSED
                          : word == "FAILED" ? TestStatus::FAILED : TestStatus::SKIPPED;
            sc.put(make_case(m[2].str(), m[1].str(), st));
        }
    }
    return sc;
}

// ---- sbt / ScalaTest ----

ConsoleScan scan_sbt(const std::vector<std::string>& lines) {
    static const std::regex sbt_re(
        R"(Total\s+(\d+),\s*Failed\s+(\d+),\s*Errors\s+(\d+),\s*Passed\s+(\d+)(?:,\s*Ignored\s+(\d+))?(?:,\s*Skipped\s+(\d+))?)");
    static const std::regex scalatest_re(
        R"(Tests: succeeded (\d+), failed (\d+), canceled (\d+), ignored (\d+), pending (\d+))");
    static const std::regex case_re(R"(^(?:\[info\] )?- (.+?)( \*\*\* FAILED \*\*\*| !!! IGNORED !!!| \(pending\))?(?: \(\d+ milliseconds?\))?$)");

    ConsoleScan sc;
    TestSummary scalatest;
    bool have_scalatest = false;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "Total") && std::regex_search(line, m, sbt_re)) {
            sc.summary.total += num(m[1]);
            sc.summary.failed += num(m[2]);
            sc.summary.errors += num(m[3]);
            sc.summary.passed += num(m[4]);
            sc.summary.skipped += num(m[5]) + num(m[6]);
            sc.have_summary = true;
        } else if (contains(line, "succeeded") && std::regex_search(line, m, scalatest_re)) {
            scalatest.passed += num(m[1]);
            scalatest.failed += num(m[2]);
            scalatest.errors += num(m[3]);
            scalatest.skipped += num(m[4]) + num(m[5]);
            have_scalatest = true;
        } else if (std::regex_search(line, m, case_re)) {
            const std::string suffix = m[2].str();
            TestStatus st = suffix.empty() ? TestStatus::PASSED
                          : contains(suffix, "FAILED") ? TestStatus::FAILED : TestStatus::SKIPPED;
            sc.put(make_case(m[1].str(), "", st));
        }
    }
    // sbt's own totals take precedence; ScalaTest's line is used when sbt printed none
    if (!sc.have_summary && have_scalatest) {
        sc.summary = scalatest;
        sc.have_summary = true;
    }
    return sc;
}

// ---- PHPUnit ----

ConsoleScan scan_phpunit(const std::vector<std::string>& lines) {
    static const std::regex ok_re(R"(^OK \((\d+) tests?, (\d+) assertions?\))");
    static const std::regex tests_re(R"(^Tests: (\d+), Assertions: (\d+)(.*)$)");
    static const std::regex count_re(R"((Failures|Errors|Skipped|Incomplete): (\d+))");
    static const std::regex section_re(R"(^There (?:was|were) \d+ (failure|error|skipped test|incomplete test|risky test|warning)s?:)");
    static const std::regex entry_re(R"(^\d+\) (\S+)::(\S+?)(?: with data set .*)?$)");

    ConsoleScan sc;
    TestStatus section = TestStatus::FAILED;
    bool in_section = false;
    std::smatch m;
    for (const auto& line : lines) {
        if (std::regex_search(line, m, ok_re)) {
            sc.summary = TestSummary{};
            sc.summary.total = num(m[1]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, tests_re)) {
            TestSummary s;
            s.total = num(m[1]);
            const std::string rest = m[3].str();
            for (std::sregex_iterator it(rest.begin(), rest.end(), count_re), end; it != end; ++it) {
                const int64_t n = pu::to_i64((*it)[2].str());
                const std::string kind = (*it)[1].str();
                if (kind == "Failures") s.failed += n;
                else if (kind == "Errors") s.errors += n;
                else s.skipped += n;
            }
            sc.summary = s;
            sc.have_summary = true;
        } else if (std::regex_search(line, m, section_re)) {
            const std::string kind = m[1].str();
            in_section = kind == "failure" || kind == "error" || kind == "skipped test" || kind == "incomplete test";
            section = kind == "failure" ? TestStatus::FAILED
                    : kind == "error" ? TestStatus::ERROR : TestStatus::SKIPPED;
        } else if (in_section && std::regex_search(line, m, entry_re)) {
            sc.put(make_case(m[2].str(), m[1].str(), section));
        }
    }
    return sc;
}

// ---- RSpec (progress/documentation formatter) ----

ConsoleScan scan_rspec(const std::vector<std::string>& lines) {
    static const std::regex summary_re(
        R"(^(\d+) examples?, (\d+) failures?(?:, (\d+) pending)?(?:, (\d+) errors? occurred outside of examples)?)");
    static const std::regex failed_re(R"(^rspec (\./[^:\s]+):\d+ # (.+)$)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "example") && std::regex_search(line, m, summary_re)) {
            sc.summary = TestSummary{};
            sc.summary.errors = num(m[4]);
            sc.summary.total = num(m[1]) + sc.summary.errors;
            sc.summary.failed = num(m[2]);
            sc.summary.skipped = num(m[3]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, failed_re)) {
            sc.put(make_case(m[2].str(), m[1].str(), TestStatus::FAILED));
        }
    }
    return sc;
}

// ---- GoogleTest console ----

ConsoleScan scan_gtest(const std::vector<std::string>& lines) {
    static const std::regex ran_re(R"(^\[==========\] (\d+) tests? from \d+ test (?:suites?|cases?) ran)");
    static const std::regex running_re(R"(^\[==========\] Running (\d+) tests? from)");
    static const std::regex passed_re(R"(^\[  PASSED  \] (\d+) tests?\.)");
    static const std::regex failed_re(R"(^\[  FAILED  \] (\d+) tests?, listed below)");
    static const std::regex skipped_re(R"(^\[  SKIPPED \] (\d+) tests?, listed below)");
    static const std::regex case_re(
        R"(^\[ *(OK|FAILED|SKIPPED) *\] ([^ ,]+?)\.([^ ,]+)(?:, where .*?)? \((\d+) ms\)$)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (line.empty() || line[0] != '[') continue;
        if (std::regex_search(line, m, running_re)) {
            sc.collected += num(m[1]);
        } else if (std::regex_search(line, m, ran_re)) {
            sc.summary.total += num(m[1]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, passed_re)) {
            sc.summary.passed += num(m[1]);
        } else if (std::regex_search(line, m, failed_re)) {
            sc.summary.failed += num(m[1]);
        } else if (std::regex_search(line, m, skipped_re)) {
            sc.summary.skipped += num(m[1]);
        } else if (std::regex_search(line, m, case_re)) {
            const std::string word = m[1].str();
            TestStatus st = word == "OK" ? TestStatus::PASSED
                          : word == "FAILED" ? TestStatus::FAILED : TestStatus::SKIPPED;
            sc.put(make_case(m[3].str(), m[2].str(), st, pu::to_seconds(m[4].str()) / 1000.0));
        }
    }
    return sc;
}

// ---- CTest console ----

ConsoleScan scan_ctest(const std::vector<std::string>& lines) {
    static const std::regex summary_re(R"((\d+)% tests passed, (\d+) tests? failed out of (\d+))");
    static const std::regex case_re(
        R"(^\s*\d+/\d+ Test\s+#\d+: (\S+) \.*\s*(?:\*\*\*)?(Passed|Failed|Not Run(?: \(Disabled\))?|Timeout|Exception|Skipped)(?=\s|$).*?([0-9.]+) sec)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "tests passed") && std::regex_search(line, m, summary_re)) {
            sc.summary = TestSummary{};
            sc.summary.total = num(m[3]);
            sc.summary.failed = num(m[2]);
            sc.have_summary = true;
        } else if (contains(line, "Test") && std::regex_search(line, m, case_re)) {
            const std::string word = m[2].str();
            TestStatus st = TestStatus::FAILED;
            if (word == "Passed") st = TestStatus::PASSED;
            else if (word == "Skipped" || word == "Not Run (Disabled)") st = TestStatus::SKIPPED;
            else if (word == "Not Run") st = TestStatus::ERROR;
            TestCase t = make_case(m[1].str(), "", st, pu::to_seconds(m[3].str()));
            if (st != TestStatus::PASSED) t.message = word;
            sc.put(std::move(t));
        }
    }
    // ctest excludes skipped tests from "failed out of N"; fold them back in
    if (sc.have_summary) {
        for (const auto& t : sc.tests) {
            if (t.status == TestStatus::SKIPPED) sc.summary.skipped++;
        }
        sc.summary.total += sc.summary.skipped;
    }
    return sc;
}

// ---- Maven Surefire ----

ConsoleScan scan_maven(const std::vector<std::string>& lines) {
    static const std::regex counts_re(R"(Tests run: (\d+), Failures: (\d+), Errors: (\d+), Skipped: (\d+)(.*)$)");
    static const std::regex case3_re(
        R"(^\[ERROR\] (\S+)\.([^.\s]+)\s+--\s+Time elapsed: ([0-9.,]+) s\s+<<< (FAILURE|ERROR)!)");
    static const std::regex case2_re(
        R"(^\[ERROR\] ([^(\s]+)\((\S+)\)\s+Time elapsed: ([0-9.,]+) s(?:ec)?\s+<<< (FAILURE|ERROR)!)");

    ConsoleScan sc;
    std::smatch m;
    for (const auto& line : lines) {
        if (contains(line, "Tests run:") && std::regex_search(line, m, counts_re)) {
            // per-class lines carry "Time elapsed"; the aggregate after "Results:" does not
            if (contains(m[5].str(), "Time elapsed")) continue;
            sc.summary.total += num(m[1]);
            sc.summary.failed += num(m[2]);
            sc.summary.errors += num(m[3]);
            sc.summary.skipped += num(m[4]);
            sc.have_summary = true;
        } else if (std::regex_search(line, m, case3_re)) {
            sc.put(make_case(m[2].str(), m[1].str(),
                             m[4].str() == "FAILURE" ? TestStatus::FAILED : TestStatus::ERROR,
                             pu::to_seconds(m[3].str())));
        } else if (std::regex_search(line, m, case2_re)) {
            sc.put(make_case(m[1].str(), m[2].str(),
                             m[4].str() == "FAILURE" ? TestStatus::FAILED : TestStatus::ERROR,
                             pu::to_seconds(m[3].str())));
        }
    }
    return sc;
}

// ---- go test -v ----

ConsoleScan scan_go(const std::vector<std::string>& lines) {
    static const std::regex case_re(R"(^\s*--- (PASS|FAIL|SKIP): (\S+) \(([0-9.]+)s\))");
    static const std::regex pkg_re(R"(^(ok|FAIL)\s+(\S+)\s+(\[build failed\]|\[setup failed\]|[0-9.]+s|\(cached\)))");

    ConsoleScan sc;
    std::vector<TestCase> pending; // results arrive before their package line
    std::smatch m;
    for (const auto& line : lines) {
        if (line.rfind("=== RUN", 0) == 0) {
            sc.collected++;
        } else if (std::regex_search(line, m, case_re)) {
            const std::string word = m[1].str();
            TestStatus st = word == "PASS" ? TestStatus::PASSED
                          : word == "FAIL" ? TestStatus::FAILED : TestStatus::SKIPPED;
            pending.push_back(make_case(m[2].str(), "", st, pu::to_seconds(m[3].str())));
        } else if (std::regex_search(line, m, pkg_re)) {
            const std::string pkg = m[2].str();
            for (auto& t : pending) {
                t.classname = pkg;
                sc.put(std::move(t));
            }
            pending.clear();
            if (m[3].str() == "[build failed]" || m[3].str() == "[setup failed]") {
                TestCase t = make_case(pkg, "", TestStatus::ERROR);
                t.message = m[3].str();
                sc.put(std::move(t));
            }
        }
    }
    for (auto& t : pending) sc.put(std::move(t));
    return sc;
}

} // namespace

const char* console_format_to_str(ConsoleFormat f) {
    switch (f) {
        case ConsoleFormat::PYTEST:  return "pytest";
        case ConsoleFormat::CARGO:   return "cargo";
        case ConsoleFormat::JEST:    return "jest";
        case ConsoleFormat::MOCHA:   return "mocha";
        case ConsoleFormat::GRADLE:  return "gradle";
        case ConsoleFormat::SBT:     return "sbt";
        case ConsoleFormat::PHPUNIT: return "phpunit";
        case ConsoleFormat::RSPEC:   return "rspec";
        case ConsoleFormat::GTEST:   return "gtest";
        case ConsoleFormat::CTEST:   return "ctest";
        case ConsoleFormat::MAVEN:   return "maven";
        case ConsoleFormat::GO:      return "go";
    }
    return "pytest";
}

bool console_format_from_str(const std::string& s, ConsoleFormat* out) {
    for (ConsoleFormat f : all_console_formats()) {
        if (s == console_format_to_str(f)) {
            if (out) *out = f;
            return true;
        }
    }
    return false;
}

std::vector<ConsoleFormat> all_console_formats() {
    return {ConsoleFormat::PYTEST, ConsoleFormat::CARGO, ConsoleFormat::JEST, ConsoleFormat::MOCHA,
            ConsoleFormat::GRADLE, ConsoleFormat::SBT, ConsoleFormat::PHPUNIT, ConsoleFormat::RSPEC,
            ConsoleFormat::GTEST, ConsoleFormat::CTEST, ConsoleFormat::MAVEN, ConsoleFormat::GO};
}

TestReport parse_console(const std::string& text, ConsoleFormat f) {
    const auto lines = pu::split_console_lines(pu::strip_ansi(text));
    ConsoleScan sc;
    switch (f) {
        case ConsoleFormat::PYTEST:  sc = scan_pytest(lines); break;
        case ConsoleFormat::CARGO:   sc = scan_cargo(lines); break;
        case ConsoleFormat::JEST:    sc = scan_jest(lines); break;
        case ConsoleFormat::MOCHA:   sc = scan_mocha(lines); break;
        case ConsoleFormat::GRADLE:  sc = scan_gradle(lines); break;
        case ConsoleFormat::SBT:     sc = scan_sbt(lines); break;
        case ConsoleFormat::PHPUNIT: sc = scan_phpunit(lines); break;
        case ConsoleFormat::RSPEC:   sc = scan_rspec(lines); break;
        case ConsoleFormat::GTEST:   sc = scan_gtest(lines); break;
        case ConsoleFormat::CTEST:   sc = scan_ctest(lines); break;
        case ConsoleFormat::MAVEN:   sc = scan_maven(lines); break;
        case ConsoleFormat::GO:      sc = scan_go(lines); break;
    }
    return sc.to_report();
}

TestReport parse_console_output(const std::string& stdout_text,
                                const std::string& stderr_text,
                                const std::vector<ConsoleFormat>& preferred) {
    std::string text = stdout_text;
    if (!stderr_text.empty()) text += "\n" + stderr_text;

    std::vector<ConsoleFormat> order = preferred;
    for (ConsoleFormat f : all_console_formats()) {
        if (std::find(order.begin(), order.end(), f) == order.end()) order.push_back(f);
    }

    int64_t collected = 0;
    for (ConsoleFormat f : order) {
        TestReport r = parse_console(text, f);
        if (r.status != ReportStatus::UNKNOWN) return r;
        collected = std::max(collected, r.summary.collected);
    }
    return unknown_report(collected);
}

} // namespace patchbench
