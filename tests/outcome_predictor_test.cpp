#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "services/feature_builder.h"
#include "services/outcome_predictor.h"

namespace {

std::string modelPath()
{
    const char* dir = std::getenv("CLAIM_TEST_MODELS_DIR");
    return std::string(dir ? dir : "AI-Models") + "/claim_outcome_linear.json";
}

bool hasFactor(const std::vector<std::string>& factors, const std::string& needle)
{
    return std::any_of(factors.begin(), factors.end(), [&](const std::string& f) {
        return f.find(needle) != std::string::npos;
    });
}

FeatureVector collisionWithDamage()
{
    ClaimForm form{
        {"incidentType", "Collision"}, {"driver_age", 28}, {"vehicle_age", 3},
        {"policeReport", "yes"}, {"policeReportFiledWithin24h", 1}, {"witnesses", "yes"},
    };
    return FeatureBuilder().build(form, {{DamageClass::Damage, 0.93f}}, ExtractedPolicyText{});
}

void testShippedArtifact(const OutcomePredictor& predictor)
{
    FeatureVector fv = collisionWithDamage();
    auto result = predictor.predict(fv);
    assert(!result.isDegraded());

    const OutcomeEstimate& est = result.value();
    int prediction = static_cast<int>(std::lround(est.score * 100.0));
    int confidence = static_cast<int>(std::lround(est.confidence * 100.0));
    std::cout << "  collision scenario: prediction=" << prediction << " confidence=" << confidence << std::endl;

    assert(prediction >= 60 && prediction <= 85 && "documented collision should land in the upper-middle range");
    assert(confidence > 70);
    assert(hasFactor(est.key_factors, "police report"));
    assert(hasFactor(est.key_factors, "witnesses"));
    assert(hasFactor(est.key_factors, "Visual damage"));

    // A bare form is noticeably weaker than the documented one.
    FeatureVector bare = FeatureBuilder().build({}, {}, ExtractedPolicyText{});
    assert(predictor.score(bare) < est.score);
    std::cout << "[PASS] shipped artifact scores the collision scenario" << std::endl;
}

void testDeterminism(const OutcomePredictor& predictor)
{
    FeatureVector fv = collisionWithDamage();
    const double first = predictor.score(fv);
    for (int i = 0; i < 20; ++i) {
        assert(predictor.score(fv) == first);
        assert(OutcomePredictor::confidence(fv) == OutcomePredictor::confidence(collisionWithDamage()));
    }
    std::cout << "[PASS] deterministic score" << std::endl;
}

void testConfidenceHeuristic()
{
    FeatureVector fv;
    fv.missing_fields = {"incidentType", "weatherConditions", "roadConditions",
                         "vehicleDamage", "policeReport", "witnesses"};
    // 0.5 minus the capped missing-field penalty
    assert(std::fabs(OutcomePredictor::confidence(fv) - 0.35) < 1e-9);

    fv.evidence_images = 2;
    fv.unknown_images = 2;
    assert(std::fabs(OutcomePredictor::confidence(fv) - 0.25) < 1e-9);

    FeatureVector full;
    full.police_report = full.filed_within_24h = full.witnesses = true;
    full.evidence_images = 1;
    full.policy_text_meaningful = true;
    assert(OutcomePredictor::confidence(full) == 0.95);
    std::cout << "[PASS] confidence heuristic" << std::endl;
}

void testUnitScaleAndClamp()
{
    auto model = std::make_shared<const LinearModel>(LinearModel::fromJson(
        R"({"intercept": 0.2, "output_scale": "unit", "numeric": {"previous_claims": -0.5}})"));
    OutcomePredictor p(model);

    FeatureVector fv;
    assert(std::fabs(p.score(fv) - 0.2) < 1e-9);
    fv.previous_claims = 3;
    assert(p.score(fv) == 0.0);
    assert(model->featureCount() == 1);
    std::cout << "[PASS] unit scale and clamping" << std::endl;
}

void testMalformedArtifacts()
{
    const char* bad[] = {
        "not json",
        R"({"numeric": {}})",
        R"({"intercept": "high"})",
        R"({"intercept": 1, "numeric": {"driver_age": "x"}})",
        R"({"intercept": 1, "categorical": {"incident_type": 3}})",
        R"({"intercept": 1, "output_scale": "logit"})",
    };
    for (const char* text : bad) {
        bool threw = false;
        try {
            LinearModel::fromJson(text);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "malformed artifact must be rejected");
    }

    bool threw = false;
    try {
        LinearModel::loadFile("/nonexistent/model.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        OutcomePredictor p(std::make_shared<const LinearModel>(
            LinearModel::fromJson(R"({"intercept": 1, "numeric": {"horsepower": 0.1}})")));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw && "weights for unknown features must be rejected");
    std::cout << "[PASS] malformed artifacts" << std::endl;
}

void testNonFiniteDegrades()
{
    auto model = std::make_shared<const LinearModel>(LinearModel::fromJson(
        R"({"intercept": 0, "numeric": {"market_value": 1e308}})"));
    OutcomePredictor p(model);

    FeatureVector fv;
    fv.market_value = 1e308;
    auto result = p.predict(fv);
    assert(result.isDegraded());
    assert(result.value().score == OutcomePredictor::kNeutralScore);
    assert(result.value().confidence == OutcomePredictor::kLowConfidence);
    std::cout << "[PASS] non-finite output degrades to neutral" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] OutcomePredictor..." << std::endl;

    auto model = std::make_shared<const LinearModel>(LinearModel::loadFile(modelPath()));
    OutcomePredictor predictor(model);

    testShippedArtifact(predictor);
    testDeterminism(predictor);
    testConfidenceHeuristic();
    testUnitScaleAndClamp();
    testMalformedArtifacts();
    testNonFiniteDegrades();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
