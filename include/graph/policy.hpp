#pragma once

#include "graph/provenance_graph.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace prov {

// Policy codes understood by edge styling
inline const std::string POLICY_NAZI_ERA = "NAZI_ERA";
inline const std::string POLICY_UNESCO_1970 = "UNESCO_1970";

// A named legal window used to flag edges for compliance review.
// Bounds are inclusive ISO dates; an empty bound is open.
struct PolicyWindow {
    std::string code;
    std::string label;
    std::string from;
    std::string to;
    std::string ref;

    bool contains(const std::string& iso_date) const;

    nlohmann::json to_json() const;
    static PolicyWindow from_json(const nlohmann::json& j);
};

// Edge color class, one per stroke hue
enum class EdgeClass {
    Nazi,
    Unesco,
    Normal
};

std::string edge_class_to_string(EdgeClass cls);

// Ordered policy windows. Order is priority: when an edge carries several
// codes, the window listed first decides its class.
class PolicyCatalog {
public:
    PolicyCatalog() = default;
    explicit PolicyCatalog(std::vector<PolicyWindow> windows);

    // NAZI_ERA (1933-01-01..1945-12-31) then UNESCO_1970 (from 1970-11-14)
    static PolicyCatalog defaults();

    const std::vector<PolicyWindow>& windows() const { return windows_; }
    const PolicyWindow* find(const std::string& code) const;

    // Codes of every window containing the date; none for an empty date
    std::vector<std::string> codes_for_date(const std::string& date) const;

    // Highest-priority policy code carried by the edge, empty if none
    std::string dominant_code(const GraphEdge& edge) const;

    EdgeClass classify(const GraphEdge& edge) const;

    nlohmann::json to_json() const;
    static PolicyCatalog from_json(const nlohmann::json& j);

private:
    std::vector<PolicyWindow> windows_;
};

} // namespace prov
