#include "outcome_predictor.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <crow/logging.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

/* ────────────────────────────────────────────────────────── */
/*  LinearModel artifact                                     */
/* ────────────────────────────────────────────────────────── */
LinearModel LinearModel::fromJson(const std::string& json_text)
{
    rapidjson::Document doc;
    doc.Parse(json_text.c_str());
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("linear model: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject() || !doc.HasMember("intercept") || !doc["intercept"].IsNumber()) {
        throw std::runtime_error("linear model: missing numeric 'intercept'");
    }

    LinearModel m;
    m.intercept = doc["intercept"].GetDouble();

    if (doc.HasMember("version") && doc["version"].IsString()) {
        m.version = doc["version"].GetString();
    }
    if (doc.HasMember("output_scale")) {
        const auto& s = doc["output_scale"];
        std::string scale = s.IsString() ? s.GetString() : "";
        if (scale == "percent") {
            m.percent_scale = true;
        } else if (scale == "unit") {
            m.percent_scale = false;
        } else {
            throw std::runtime_error("linear model: output_scale must be 'percent' or 'unit'");
        }
    }

    if (doc.HasMember("numeric")) {
        if (!doc["numeric"].IsObject()) throw std::runtime_error("linear model: 'numeric' must be an object");
        for (auto& member : doc["numeric"].GetObject()) {
            if (!member.value.IsNumber()) {
                throw std::runtime_error(std::string("linear model: weight for '") +
                                         member.name.GetString() + "' is not a number");
            }
            m.numeric[member.name.GetString()] = member.value.GetDouble();
        }
    }

    if (doc.HasMember("categorical")) {
        if (!doc["categorical"].IsObject()) throw std::runtime_error("linear model: 'categorical' must be an object");
        for (auto& feature : doc["categorical"].GetObject()) {
            if (!feature.value.IsObject()) {
                throw std::runtime_error(std::string("linear model: categories of '") +
                                         feature.name.GetString() + "' must be an object");
            }
            auto& slot = m.categorical[feature.name.GetString()];
            for (auto& cat : feature.value.GetObject()) {
                if (!cat.value.IsNumber()) {
                    throw std::runtime_error(std::string("linear model: weight for '") +
                                             feature.name.GetString() + "=" + cat.name.GetString() +
                                             "' is not a number");
                }
                slot[cat.name.GetString()] = cat.value.GetDouble();
            }
        }
    }
    return m;
}

LinearModel LinearModel::loadFile(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw std::runtime_error("linear model not found: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return fromJson(ss.str());
}

size_t LinearModel::featureCount() const
{
    size_t n = numeric.size();
    for (const auto& [name, cats] : categorical) n += cats.size();
    return n;
}

/* ────────────────────────────────────────────────────────── */
/*  OutcomePredictor                                         */
/* ────────────────────────────────────────────────────────── */
OutcomePredictor::OutcomePredictor(std::shared_ptr<const LinearModel> model)
    : model_(std::move(model))
{
    if (!model_) throw std::invalid_argument("OutcomePredictor: null model");

    // Every weight must map onto a FeatureVector field.
    FeatureVector probe;
    const auto nums = numericInputs(probe);
    const auto cats = categoricalInputs(probe);
    for (const auto& [name, w] : model_->numeric) {
        if (!nums.count(name)) throw std::runtime_error("linear model: unknown numeric feature '" + name + "'");
    }
    for (const auto& [name, w] : model_->categorical) {
        if (!cats.count(name)) throw std::runtime_error("linear model: unknown categorical feature '" + name + "'");
    }
}

std::map<std::string, double> OutcomePredictor::numericInputs(const FeatureVector& fv) const
{
    return {
        {"driver_age",             static_cast<double>(fv.driver_age)},
        {"vehicle_age",            static_cast<double>(fv.vehicle_age)},
        {"engine_capacity",        static_cast<double>(fv.engine_capacity)},
        {"market_value",           fv.market_value},
        {"police_report",          fv.police_report ? 1.0 : 0.0},
        {"filed_within_24h",       fv.filed_within_24h ? 1.0 : 0.0},
        {"witnesses",              fv.witnesses ? 1.0 : 0.0},
        {"third_party_vehicle",    fv.third_party_vehicle ? 1.0 : 0.0},
        {"injuries",               fv.injuries ? 1.0 : 0.0},
        {"traffic_violation",      fv.traffic_violation ? 1.0 : 0.0},
        {"previous_claims",        static_cast<double>(fv.previous_claims)},
        {"visual_damage_detected", fv.visual_damage_detected ? 1.0 : 0.0},
        {"policy_text_meaningful", fv.policy_text_meaningful ? 1.0 : 0.0},
    };
}

std::map<std::string, std::string> OutcomePredictor::categoricalInputs(const FeatureVector& fv) const
{
    return {
        {"incident_type",      fv.incident_type},
        {"time_of_day",        fv.time_of_day},
        {"weather_conditions", fv.weather_conditions},
        {"road_conditions",    fv.road_conditions},
        {"damage_severity",    toString(fv.damage_severity)},
        {"at_fault",           fv.at_fault},
        {"coverage_type",      fv.coverage_type},
    };
}

double OutcomePredictor::score(const FeatureVector& fv) const
{
    double y = model_->intercept;

    const auto nums = numericInputs(fv);
    for (const auto& [name, weight] : model_->numeric) {
        y += weight * nums.at(name);
    }

    const auto cats = categoricalInputs(fv);
    for (const auto& [name, weights] : model_->categorical) {
        auto hit = weights.find(cats.at(name));
        if (hit != weights.end()) y += hit->second;
    }

    if (model_->percent_scale) y /= 100.0;
    if (!std::isfinite(y)) throw std::domain_error("linear model produced a non-finite score");
    return std::clamp(y, 0.0, 1.0);
}

double OutcomePredictor::confidence(const FeatureVector& fv)
{
    double c = 0.50;
    if (fv.police_report) c += 0.15;
    if (fv.filed_within_24h) c += 0.10;
    if (fv.witnesses) c += 0.10;
    if (fv.evidence_images > fv.unknown_images) c += 0.10;
    if (fv.policy_text_meaningful) c += 0.05;

    c -= std::min(0.15, 0.05 * static_cast<double>(fv.missing_fields.size()));
    if (fv.unknown_images > 0) c -= 0.10;

    return std::clamp(c, 0.10, 0.95);
}

std::vector<std::string> OutcomePredictor::keyFactors(const FeatureVector& fv)
{
    std::vector<std::string> out;

    if (fv.police_report && fv.filed_within_24h) {
        out.push_back("Timely police report filed within 24 hours");
    } else if (fv.police_report) {
        out.push_back("Police report filed, but not within 24 hours");
    } else {
        out.push_back("No police report on record");
    }

    if (fv.witnesses) out.push_back("Independent witnesses available");

    if (fv.visual_damage_detected) {
        out.push_back("Visual damage confirmed in evidence photos");
    } else if (fv.evidence_images == 0) {
        out.push_back("No photographic evidence provided");
    } else if (fv.unknown_images == fv.evidence_images) {
        out.push_back("Evidence photos could not be analysed");
    } else {
        out.push_back("Evidence photos show no clear damage");
    }

    if (fv.traffic_violation) out.push_back("Traffic violation recorded");
    if (fv.previous_claims > 0) {
        out.push_back(std::to_string(fv.previous_claims) +
                      (fv.previous_claims == 1 ? " previous claim on record" : " previous claims on record"));
    }
    if (fv.third_party_vehicle) out.push_back("Third-party vehicle involved");
    if (fv.injuries) out.push_back("Injuries reported");
    if (fv.policy_text_meaningful) out.push_back("Policy document analysed");
    if (!fv.missing_fields.empty()) {
        out.push_back(std::to_string(fv.missing_fields.size()) + " claim details missing from the form");
    }
    return out;
}

StageResult<OutcomeEstimate> OutcomePredictor::predict(const FeatureVector& fv) const
{
    OutcomeEstimate neutral;
    neutral.score = kNeutralScore;
    neutral.confidence = kLowConfidence;

    try {
        OutcomeEstimate est;
        est.score = score(fv);
        est.confidence = confidence(fv);
        est.key_factors = keyFactors(fv);
        return StageResult<OutcomeEstimate>::ok(std::move(est));
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "[predictor] inference failed: " << e.what();
        return StageResult<OutcomeEstimate>::degraded(std::move(neutral),
                                                      std::string("outcome model failed: ") + e.what());
    }
}
