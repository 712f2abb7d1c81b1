#include "patchbench/parsers.h"
#include "patchbench/log.h"
#include "patchbench/json_mini.h"
#include "patchbench/report.h"
#include "parse_util.h"

namespace patchbench {

namespace pu = parse_util;

namespace {

size_t first_non_space(const std::string& s, size_t from = 0) {
    while (from < s.size() && (s[from] == ' ' || s[from] == '\t' || s[from] == '\r' || s[from] == '\n')) from++;
    return from;
}

} // namespace

ArtifactFormat sniff_format(const std::string& raw) {
    const std::string bytes = pu::strip_bom(raw);
    const size_t i = first_non_space(bytes);
    if (i >= bytes.size()) return ArtifactFormat::EMPTY;
    if (bytes[i] == '<') return ArtifactFormat::XML;
    if (bytes[i] == '{' || bytes[i] == '[') {
        // one document, or one object per line
        if (json_mini::parse(bytes)) return ArtifactFormat::JSON;
        const size_t nl = bytes.find('\n', i);
        if (nl != std::string::npos) {
            const std::string first_line = pu::trim(bytes.substr(i, nl - i));
            if (json_mini::parse(first_line)) return ArtifactFormat::NDJSON;
        }
        return ArtifactFormat::JSON; // truncated JSON still goes to the JSON parser
    }
    return ArtifactFormat::TEXT;
}

TestReport parse_artifact(const std::string& bytes, const std::string& hint) {
    switch (sniff_format(bytes)) {
        case ArtifactFormat::EMPTY:
            return unknown_report();
        case ArtifactFormat::XML:
            return parse_xml_report(bytes);
        case ArtifactFormat::JSON: {
            TestReport r = parse_json_report(bytes);
            // a go event stream with a single event is also one valid document
            if (r.status == ReportStatus::UNKNOWN) {
                TestReport events = parse_go_test_events(bytes);
                if (events.status != ReportStatus::UNKNOWN) return events;
            }
            return r;
        }
        case ArtifactFormat::NDJSON:
            return parse_go_test_events(bytes);
        case ArtifactFormat::TEXT:
            break;
    }
    ConsoleFormat f;
    if (!hint.empty() && console_format_from_str(hint, &f)) return parse_console(bytes, f);
    if (!hint.empty()) console_line("[report] unknown console format hint: " + hint);
    return parse_console_output(bytes, "", {});
}

} // namespace patchbench
