#include "feature_builder.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace form {

namespace {

std::string trim(const std::string& s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string formatNumber(double d)
{
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }
    std::ostringstream os;
    os << d;
    return os.str();
}

} // namespace

std::string toText(const FormValue& v)
{
    std::string out;
    if (v.isBool()) {
        out = std::get<bool>(v.value) ? "true" : "false";
    } else if (v.isNumber()) {
        out = formatNumber(std::get<double>(v.value));
    } else if (v.isString()) {
        out = std::get<std::string>(v.value);
    }
    out = trim(out);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<double> toNumber(const FormValue& v)
{
    if (v.isNumber()) {
        double d = std::get<double>(v.value);
        if (std::isfinite(d)) return d;
        return std::nullopt;
    }
    if (v.isBool()) return std::get<bool>(v.value) ? 1.0 : 0.0;
    if (!v.isString()) return std::nullopt;

    // Leading number only: "13+" -> 13, "0-3" -> 0, "1,600" -> 1600.
    std::string text = toText(v);
    text.erase(std::remove(text.begin(), text.end(), ','), text.end());
    if (text.empty()) return std::nullopt;

    const char* begin = text.c_str();
    char* end = nullptr;
    double d = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(d)) return std::nullopt;
    return d;
}

bool toFlag(const FormValue& v)
{
    if (v.isBool()) return std::get<bool>(v.value);
    if (v.isNumber()) return std::get<double>(v.value) != 0.0;

    const std::string t = toText(v);
    if (t == "yes" || t == "y" || t == "true" || t == "on" ||
        t == "within-24h" || t == "within_24h") {
        return true;
    }
    if (t.empty() || t == "no" || t == "n" || t == "false" || t == "off") return false;

    auto n = toNumber(v);
    return n && *n != 0.0;
}

int toInt(const FormValue& v, int fallback)
{
    auto n = toNumber(v);
    if (!n || *n > 1e9 || *n < -1e9) return fallback;
    return static_cast<int>(std::lround(*n));
}

double toDouble(const FormValue& v, double fallback)
{
    auto n = toNumber(v);
    return n ? *n : fallback;
}

} // namespace form

namespace {

// Categorical values share one spelling: lower-case, '-' and ' ' as '_'.
std::string category(const FormValue& v)
{
    std::string t = form::toText(v);
    std::replace(t.begin(), t.end(), '-', '_');
    std::replace(t.begin(), t.end(), ' ', '_');
    return t;
}

// Only an explicit answer moves the fault feature; "unsure", "unknown" and
// anything unrecognised stay "unknown".
std::string atFaultCategory(const FormValue& v)
{
    if (v.isBool()) return std::get<bool>(v.value) ? "yes" : "no";
    if (v.isNumber()) return std::get<double>(v.value) != 0.0 ? "yes" : "no";

    const std::string t = form::toText(v);
    if (t == "partial") return "partial";
    if (t == "yes" || t == "y" || t == "true" || t == "on" || t == "1") return "yes";
    if (t == "no" || t == "n" || t == "false" || t == "off" || t == "0") return "no";
    return "unknown";
}

} // namespace

const FormValue* FeatureBuilder::lookup(const ClaimForm& form,
                                        std::initializer_list<const char*> keys) const
{
    for (const char* key : keys) {
        auto it = form.find(key);
        if (it == form.end() || it->second.isNull()) continue;
        if (it->second.isString() && form::toText(it->second).empty()) continue;
        return &it->second;
    }
    return nullptr;
}

DamageSeverity FeatureBuilder::parseSeverity(const std::string& text)
{
    std::string t = text;
    std::replace(t.begin(), t.end(), '-', '_');
    std::replace(t.begin(), t.end(), ' ', '_');

    if (t == "none" || t == "no_damage" || t == "no") return DamageSeverity::None;
    if (t == "minor" || t == "light") return DamageSeverity::Minor;
    if (t == "moderate") return DamageSeverity::Moderate;
    if (t == "major" || t == "major_damage" || t == "severe" ||
        t == "fraud_related_damage") {
        return DamageSeverity::Major;
    }
    if (t == "total_loss" || t == "totalled" || t == "write_off") return DamageSeverity::TotalLoss;
    return DamageSeverity::Moderate;
}

std::string FeatureBuilder::timeOfDayFromClock(const std::string& hhmm)
{
    int hour = -1, minute = 0;
    if (std::sscanf(hhmm.c_str(), "%d:%d", &hour, &minute) < 1 || hour < 0 || hour > 23) {
        return {};
    }
    if (hour >= 5 && hour <= 11) return "morning";
    if (hour >= 12 && hour <= 16) return "afternoon";
    if (hour >= 17 && hour <= 20) return "evening";
    return "night";
}

FeatureVector FeatureBuilder::build(const ClaimForm& form,
                                    const std::vector<DamageLabel>& labels,
                                    const ExtractedPolicyText& policy) const
{
    FeatureVector fv;

    /* ---------- Incident ---------- */
    if (auto v = lookup(form, {"incidentType", "incident_type"})) {
        fv.incident_type = category(*v);
    } else {
        fv.missing_fields.push_back("incidentType");
    }

    if (auto v = lookup(form, {"timeOfDay", "time_of_day"})) {
        fv.time_of_day = category(*v);
    } else if (auto clock = lookup(form, {"incidentTime", "incident_time"})) {
        std::string derived = timeOfDayFromClock(form::toText(*clock));
        if (!derived.empty()) fv.time_of_day = derived;
    }

    if (auto v = lookup(form, {"weatherConditions", "weather_conditions"})) {
        fv.weather_conditions = category(*v);
    } else {
        fv.missing_fields.push_back("weatherConditions");
    }

    if (auto v = lookup(form, {"roadConditions", "road_conditions"})) {
        fv.road_conditions = category(*v);
    } else {
        fv.missing_fields.push_back("roadConditions");
    }

    /* ---------- Driver / vehicle ---------- */
    if (auto v = lookup(form, {"driver_age", "driverAge"})) {
        fv.driver_age = std::clamp(form::toInt(*v, fv.driver_age), 16, 100);
    }
    if (auto v = lookup(form, {"vehicle_age", "vehicleAge"})) {
        fv.vehicle_age = std::clamp(form::toInt(*v, fv.vehicle_age), 0, 60);
    }
    if (auto v = lookup(form, {"engine_capacity", "engineCapacity"})) {
        fv.engine_capacity = std::max(0, form::toInt(*v, fv.engine_capacity));
    }
    if (auto v = lookup(form, {"market_value", "marketValue"})) {
        fv.market_value = std::max(0.0, form::toDouble(*v, fv.market_value));
    }
    if (auto v = lookup(form, {"coverageType", "coverage_type"})) {
        fv.coverage_type = category(*v);
    }

    /* ---------- Damage ---------- */
    if (auto v = lookup(form, {"vehicleDamage", "damageExtent", "damage_severity"})) {
        fv.damage_severity = parseSeverity(form::toText(*v));
    } else {
        fv.missing_fields.push_back("vehicleDamage");
    }

    /* ---------- Documentation / circumstances ---------- */
    if (auto v = lookup(form, {"policeReport", "policeReportFiled", "police_report"})) {
        fv.police_report = form::toFlag(*v);
    } else {
        fv.missing_fields.push_back("policeReport");
    }

    if (auto v = lookup(form, {"policeReportFiledWithin24h", "filed_within_24h"})) {
        fv.filed_within_24h = form::toFlag(*v);
    } else if (auto t = lookup(form, {"policeReportTime"})) {
        fv.filed_within_24h = form::toFlag(*t);
    }

    if (auto v = lookup(form, {"witnesses", "hasWitnesses"})) {
        fv.witnesses = form::toFlag(*v);
    } else if (auto count = lookup(form, {"witnessCount"})) {
        fv.witnesses = form::toInt(*count, 0) > 0;
    } else {
        fv.missing_fields.push_back("witnesses");
    }

    if (auto v = lookup(form, {"thirdPartyVehicle", "third_party_vehicle"})) {
        fv.third_party_vehicle = form::toFlag(*v);
    }
    if (auto v = lookup(form, {"injuries"})) {
        fv.injuries = form::toFlag(*v);
    }
    if (auto v = lookup(form, {"trafficViolation", "traffic_violation"})) {
        fv.traffic_violation = form::toFlag(*v);
    }
    if (auto v = lookup(form, {"atFault", "at_fault"})) {
        fv.at_fault = atFaultCategory(*v);
    }
    if (auto v = lookup(form, {"previousClaims", "previous_claims"})) {
        fv.previous_claims = v->isString() && !form::toNumber(*v)
                                 ? (form::toFlag(*v) ? 1 : 0)
                                 : std::clamp(form::toInt(*v, 0), 0, 20);
    }

    /* ---------- Evidence aggregate ---------- */
    fv.evidence_images = static_cast<int>(labels.size());
    for (const auto& l : labels) {
        if (l.label == DamageClass::Damage) ++fv.damage_images;
        if (l.label == DamageClass::Unknown) ++fv.unknown_images;
    }
    fv.visual_damage_detected = fv.damage_images > 0;
    fv.policy_text_meaningful = policy.meaningful;

    return fv;
}

std::string FeatureBuilder::summarize(const ClaimForm& form)
{
    std::ostringstream os;
    for (const auto& [key, value] : form) {          // std::map: sorted by key
        if (value.isNull()) continue;
        std::string text;
        if (value.isString()) {
            text = std::get<std::string>(value.value);
        } else {
            text = form::toText(value);
        }
        if (text.empty()) continue;
        os << key << ": " << text << "\n";
    }
    return os.str();
}
