#include "graph/policy.hpp"
#include <stdexcept>

namespace prov {

bool PolicyWindow::contains(const std::string& iso_date) const {
    if (iso_date.empty()) return false;
    // ISO dates compare correctly as strings
    bool start_ok = from.empty() || iso_date >= from;
    bool end_ok = to.empty() || iso_date <= to;
    return start_ok && end_ok;
}

nlohmann::json PolicyWindow::to_json() const {
    nlohmann::json j;
    j["code"] = code;
    j["label"] = label;
    j["from"] = from.empty() ? nlohmann::json(nullptr) : nlohmann::json(from);
    j["to"] = to.empty() ? nlohmann::json(nullptr) : nlohmann::json(to);
    j["ref"] = ref;
    return j;
}

PolicyWindow PolicyWindow::from_json(const nlohmann::json& j) {
    PolicyWindow window;
    window.code = j.at("code").get<std::string>();
    window.label = j.value("label", window.code);
    if (j.contains("from") && !j["from"].is_null()) {
        window.from = to_iso_date(j["from"].get<std::string>());
    }
    if (j.contains("to") && !j["to"].is_null()) {
        window.to = to_iso_date(j["to"].get<std::string>());
    }
    window.ref = j.value("ref", "");
    return window;
}

std::string edge_class_to_string(EdgeClass cls) {
    switch (cls) {
        case EdgeClass::Nazi:   return "nazi";
        case EdgeClass::Unesco: return "unesco";
        case EdgeClass::Normal: return "normal";
    }
    return "normal";
}

PolicyCatalog::PolicyCatalog(std::vector<PolicyWindow> windows)
    : windows_(std::move(windows)) {}

PolicyCatalog PolicyCatalog::defaults() {
    return PolicyCatalog({
        {
            POLICY_NAZI_ERA,
            "Washington Conference Principles (1933-1945)",
            "1933-01-01",
            "1945-12-31",
            "https://www.state.gov/washington-conference-principles-on-nazi-confiscated-art"
        },
        {
            POLICY_UNESCO_1970,
            "UNESCO 1970 Convention",
            "1970-11-14",
            "",
            "https://www.unesco.org/en/legal-affairs/convention-means-prohibiting-and-preventing-illicit-import-export-and-transfer-ownership-cultural"
        }
    });
}

const PolicyWindow* PolicyCatalog::find(const std::string& code) const {
    for (const auto& window : windows_) {
        if (window.code == code) return &window;
    }
    return nullptr;
}

std::vector<std::string> PolicyCatalog::codes_for_date(const std::string& date) const {
    std::vector<std::string> hits;
    std::string iso = to_iso_date(date);
    if (iso.empty()) return hits;

    for (const auto& window : windows_) {
        if (window.contains(iso)) {
            hits.push_back(window.code);
        }
    }
    return hits;
}

std::string PolicyCatalog::dominant_code(const GraphEdge& edge) const {
    for (const auto& window : windows_) {
        if (edge.has_policy(window.code)) {
            return window.code;
        }
    }
    return "";
}

EdgeClass PolicyCatalog::classify(const GraphEdge& edge) const {
    std::string code = dominant_code(edge);
    if (code == POLICY_NAZI_ERA) return EdgeClass::Nazi;
    if (code == POLICY_UNESCO_1970) return EdgeClass::Unesco;
    return EdgeClass::Normal;
}

nlohmann::json PolicyCatalog::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& window : windows_) {
        arr.push_back(window.to_json());
    }
    return arr;
}

PolicyCatalog PolicyCatalog::from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::runtime_error("Policy catalog must be a JSON array");
    }
    std::vector<PolicyWindow> windows;
    for (const auto& window_json : j) {
        windows.push_back(PolicyWindow::from_json(window_json));
    }
    return PolicyCatalog(std::move(windows));
}

} // namespace prov
