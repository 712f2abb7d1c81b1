#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace patchbench {

// Content shape of a report artifact, decided by sniffing bytes rather than
// trusting the file extension.
enum class ArtifactFormat { XML, JSON, NDJSON, TEXT, EMPTY };

ArtifactFormat sniff_format(const std::string& bytes);

// Console (plain text) report formats recognised by the text fallback.
enum class ConsoleFormat {
    PYTEST,
    CARGO,
    JEST,
    MOCHA,
    GRADLE,
    SBT,
    PHPUNIT,
    RSPEC,
    GTEST,
    CTEST,
    MAVEN,
    GO,
};

const char* console_format_to_str(ConsoleFormat f);
bool console_format_from_str(const std::string& s, ConsoleFormat* out);
std::vector<ConsoleFormat> all_console_formats();

// ---- structured XML ----
TestReport parse_junit_xml(const std::string& xml);
TestReport parse_ctest_xml(const std::string& xml);  // CTest dashboard Testing/<tag>/Test.xml
TestReport parse_xml_report(const std::string& xml); // picks JUnit or CTest by root element

// ---- structured JSON ----
TestReport parse_json_report(const std::string& json); // detects the producing framework by keys

// ---- streaming NDJSON (go test -json) ----
TestReport parse_go_test_events(const std::string& ndjson);

// ---- unstructured console output ----
TestReport parse_console(const std::string& text, ConsoleFormat f);

// Try `preferred` first, then every other console format; the first one
// yielding test evidence wins. stdout and stderr are scanned together.
TestReport parse_console_output(const std::string& stdout_text,
                                const std::string& stderr_text,
                                const std::vector<ConsoleFormat>& preferred);

// Single entry point for one artifact: (bytes, hint) -> TestReport.
// `hint` is a console format name (or empty) used only when the bytes are plain text.
// Never throws; unrecognisable bytes yield an unknown report.
TestReport parse_artifact(const std::string& bytes, const std::string& hint = "");

} // namespace patchbench
