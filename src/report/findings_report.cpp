#include "report/findings_report.hpp"

#include <format>

namespace piishield {

namespace {

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

std::map<std::string, size_t> FindingsReport::counts_by_type() const {
    std::map<std::string, size_t> counts;
    for (const auto& f : findings) {
        ++counts[f.type];
    }
    return counts;
}

nlohmann::ordered_json FindingsReport::to_json() const {
    nlohmann::ordered_json doc;
    doc["source"] = source;

    nlohmann::ordered_json by_type = nlohmann::ordered_json::object();
    for (const auto& [type, count] : counts_by_type()) {
        by_type[type] = count;
    }
    doc["summary"] = {
        {"total", total()},
        {"degraded", degraded()},
        {"by_type", std::move(by_type)},
    };

    auto items = nlohmann::ordered_json::array();
    for (const auto& f : findings) {
        nlohmann::ordered_json item;
        item["type"] = f.type;
        item["excerpt"] = f.excerpt;
        item["score"] = f.score;
        item["start"] = f.start;
        item["end"] = f.end;
        if (f.unit) {
            item["column"] = f.unit->column;
            item["row"] = f.unit->row;
        }
        item["recognizer"] = f.recognizer;
        items.push_back(std::move(item));
    }
    doc["findings"] = std::move(items);

    auto warns = nlohmann::ordered_json::array();
    for (const auto& w : warnings) {
        warns.push_back({
            {"recognizer", w.recognizer},
            {"kind", failure_kind_to_string(w.kind)},
            {"message", w.message},
        });
    }
    doc["warnings"] = std::move(warns);
    return doc;
}

std::string FindingsReport::to_json_string(int indent) const {
    return to_json().dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string FindingsReport::to_csv() const {
    std::string out = "Column,Row,PII_Type,Text,Score,Start,End,Recognizer\n";
    for (const auto& f : findings) {
        out += std::format("{},{},{},{},{:.2f},{},{},{}\n",
            f.unit ? csv_escape(f.unit->column) : "",
            f.unit ? std::to_string(f.unit->row) : "",
            csv_escape(f.type),
            csv_escape(f.excerpt),
            f.score,
            f.start,
            f.end,
            csv_escape(f.recognizer));
    }
    return out;
}

} // namespace piishield
