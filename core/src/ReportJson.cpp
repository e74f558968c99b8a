#include "wattline/ReportJson.h"
#include "wattline/Utility.h"

#include <cmath>
#include <optional>
#include <sstream>
#include <vector>

namespace wattline {

namespace {

std::string json_escape(const std::string& s) {
    std::ostringstream o;
    o << '"';
    for (char c : s) {
        switch (c) {
            case '\\': o << "\\\\"; break;
            case '"':  o << "\\\""; break;
            case '\b': o << "\\b";  break;
            case '\f': o << "\\f";  break;
            case '\n': o << "\\n";  break;
            case '\r': o << "\\r";  break;
            case '\t': o << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    const char* hex = "0123456789abcdef";
                    const auto u = static_cast<unsigned char>(c);
                    o << "\\u00" << hex[u >> 4] << hex[u & 0xF];
                } else {
                    o << c;
                }
        }
    }
    o << '"';
    return o.str();
}

// Small pretty-printing emitter; inserts separators itself.
struct J {
    std::ostringstream out;
    int indent = 2;
    int level = 0;
    std::vector<bool> first;

    void nl() { out << "\n" << std::string(static_cast<std::size_t>(level * indent), ' '); }

    void open(char c) {
        out << c;
        ++level;
        first.push_back(true);
    }
    void close(char c) {
        --level;
        const bool empty = first.back();
        first.pop_back();
        if (!empty) nl();
        out << c;
    }
    void obj_begin() { open('{'); }
    void obj_end() { close('}'); }
    void arr_begin() { open('['); }
    void arr_end() { close(']'); }

    // Separator before the next member or element.
    void next() {
        if (!first.back()) out << ",";
        first.back() = false;
        nl();
    }

    void key(const std::string& k) {
        next();
        out << json_escape(k) << ": ";
    }

    void str(const std::string& v) { out << json_escape(v); }
    void n_null() { out << "null"; }

    void num(double v) {
        if (!std::isfinite(v)) { n_null(); return; }
        std::ostringstream tmp;
        tmp.setf(std::ios::fixed);
        tmp.precision(4);
        tmp << v;
        out << tmp.str();
    }
    void num_i(long long v) { out << v; }

    void opt(const std::optional<double>& v) {
        if (v) num(*v); else n_null();
    }
    void opt_i(const std::optional<int>& v) {
        if (v) num_i(*v); else n_null();
    }
    void opt_index(const std::optional<std::size_t>& v) {
        if (v) num_i(static_cast<long long>(*v)); else n_null();
    }
};

void emit_segment(J& j, const SegmentAnalysis& s) {
    const bool skipped = s.matchQuality == MatchQuality::Skipped;

    j.obj_begin();
    j.key("segment_index"); j.num_i(static_cast<long long>(s.segmentIndex));
    j.key("segment_type"); j.str(step_type_to_string(s.type));
    j.key("description"); j.str(s.description);
    j.key("match_quality"); j.str(match_quality_to_string(s.matchQuality));
    j.key("planned_start_sec"); j.num(s.plannedStartSec);
    j.key("planned_duration_sec"); j.num(s.plannedDurationSec);
    j.key("planned_power_low"); j.num(s.targetLowWatts);
    j.key("planned_power_high"); j.num(s.targetHighWatts);
    j.key("planned_zone"); j.num_i(s.plannedZone);
    j.key("actual_start_sec"); j.opt(s.actualStartSec);
    j.key("actual_end_sec"); j.opt(s.actualEndSec);
    j.key("actual_duration_sec");
    if (skipped) j.n_null(); else j.num(s.actualDurationSec);
    j.key("actual_avg_power"); j.opt(s.actualAvgPower);
    j.key("actual_max_power"); j.opt(s.actualMaxPower);
    j.key("actual_min_power"); j.opt(s.actualMinPower);
    j.key("actual_dominant_zone"); j.opt_i(s.actualZone);

    j.key("time_in_zone");
    if (skipped) {
        j.n_null();
    } else {
        j.obj_begin();
        for (std::size_t z = 0; z < s.timeInZone.size(); ++z) {
            j.key("z" + std::to_string(z + 1)); j.num(s.timeInZone[z]);
        }
        j.obj_end();
    }

    j.key("scores");
    j.obj_begin();
    j.key("power_compliance"); j.num(s.scores.power);
    j.key("zone_compliance"); j.num(s.scores.zone);
    j.key("duration_compliance"); j.num(s.scores.duration);
    j.key("overall_segment_score"); j.num(s.scores.overall);
    j.obj_end();

    j.key("assessment"); j.str(s.assessment);

    if (!s.cycles.empty()) {
        j.key("cycles");
        j.arr_begin();
        for (const auto& c : s.cycles) {
            j.next();
            emit_segment(j, c);
        }
        j.arr_end();
    }
    j.obj_end();
}

}  // namespace

std::string report_to_json(const ComplianceReport& report, int indentSpaces) {
    J j;
    j.indent = indentSpaces;

    j.obj_begin();

    j.key("segments");
    j.arr_begin();
    for (const auto& s : report.segments) {
        j.next();
        emit_segment(j, s);
    }
    j.arr_end();

    const OverallCompliance& o = report.overall;
    j.key("overall");
    j.obj_begin();
    j.key("score"); j.num(o.score);
    j.key("grade"); j.str(o.grade);
    j.key("summary"); j.str(o.summary);
    j.key("segments_completed"); j.num_i(o.segmentsCompleted);
    j.key("segments_skipped"); j.num_i(o.segmentsSkipped);
    j.key("segments_total"); j.num_i(o.segmentsTotal);
    j.key("planned_tss"); j.num(o.plannedTss);
    j.key("executed_tss"); j.num(o.executedTss);
    j.obj_end();

    const ComplianceMetadata& m = report.metadata;
    j.key("metadata");
    j.obj_begin();
    j.key("algorithm_version"); j.str(m.algorithmVersion);
    j.key("data_quality"); j.str(data_quality_to_string(m.dataQuality));
    j.key("analyzed_duration_sec"); j.num(m.analyzedDurationSec);
    j.key("ftp_watts"); j.num(m.ftpWatts);

    const AlignmentDiagnostics& a = m.alignment;
    j.key("alignment");
    j.obj_begin();
    j.key("algorithm"); j.str(a.algorithm);
    j.key("version"); j.str(a.version);
    j.key("config"); j.str(a.configSummary);
    j.key("planned_anchor"); j.opt_index(a.anchors.planned);
    j.key("actual_anchor"); j.opt_index(a.anchors.actual);
    j.key("offset"); j.num_i(a.offset);
    j.key("path_cost"); j.num(a.pathCost);
    j.key("path_length"); j.num_i(static_cast<long long>(a.pathLength));
    j.obj_end();

    j.key("detected_pauses");
    j.arr_begin();
    for (const auto& p : m.pauses) {
        j.next();
        j.obj_begin();
        j.key("start_sec"); j.num(p.startSec);
        j.key("end_sec"); j.num(p.endSec);
        j.key("duration_sec"); j.num(p.durationSec);
        j.obj_end();
    }
    j.arr_end();
    j.obj_end();

    j.obj_end();
    j.out << "\n";
    return j.out.str();
}

}  // namespace wattline
