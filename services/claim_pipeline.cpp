#include "claim_pipeline.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <crow/logging.h>

namespace {

class RunLog
{
public:
    RunLog(PredictionResult& result, std::vector<ClaimPipeline::State>* trace)
        : result_(result), trace_(trace) {}

    void enter(ClaimPipeline::State s)
    {
        state_ = s;
        if (trace_) trace_->push_back(s);
    }

    template <typename T>
    const T& check(const StageResult<T>& r, const char* stage)
    {
        if (r.isDegraded()) {
            result_.degraded = true;
            result_.diagnostics.push_back(std::string(stage) + ": " + r.reason());
            CROW_LOG_WARNING << "[pipeline] " << stage << " degraded: " << r.reason();
        }
        return r.value();
    }

    ClaimPipeline::State state() const { return state_; }

private:
    PredictionResult& result_;
    std::vector<ClaimPipeline::State>* trace_;
    ClaimPipeline::State state_ = ClaimPipeline::State::Received;
};

} // namespace

ClaimPipeline::ClaimPipeline(std::shared_ptr<const DocumentExtractor> extractor,
                             std::shared_ptr<const DamageClassifier> classifier,
                             std::shared_ptr<const OutcomePredictor> predictor,
                             std::shared_ptr<const InsightSynthesizer> synthesizer)
    : extractor_(std::move(extractor)),
      classifier_(std::move(classifier)),
      predictor_(std::move(predictor)),
      synthesizer_(std::move(synthesizer))
{
}

std::string ClaimPipeline::toString(State state)
{
    switch (state) {
        case State::Received:         return "received";
        case State::Extracting:       return "extracting";
        case State::Classifying:      return "classifying";
        case State::FeatureBuilding:  return "feature_building";
        case State::Predicting:       return "predicting";
        case State::Synthesizing:     return "synthesizing";
        case State::DegradedComplete: return "degraded_complete";
        case State::Complete:         return "complete";
    }
    return "complete";
}

StageAvailability ClaimPipeline::availability() const
{
    StageAvailability a;
    a.extractor = extractor_ != nullptr;
    a.ocr = extractor_ && extractor_->ocrAvailable();
    a.classifier = classifier_ != nullptr;
    a.predictor = predictor_ != nullptr;
    a.synthesizer = synthesizer_ && synthesizer_->available();
    return a;
}

/* ────────────────────────────────────────────────────────── */
/*  Stages: each converts its own failures into a fallback   */
/* ────────────────────────────────────────────────────────── */
StageResult<ExtractedPolicyText> ClaimPipeline::extractStage(const ClaimSubmission& s) const
{
    if (!s.policy_document || s.policy_document->empty()) {
        return StageResult<ExtractedPolicyText>::ok(ExtractedPolicyText{});
    }
    if (!extractor_) {
        return StageResult<ExtractedPolicyText>::degraded(ExtractedPolicyText{}, "extractor unavailable");
    }
    try {
        return extractor_->extract(*s.policy_document);
    } catch (const std::exception& e) {
        return StageResult<ExtractedPolicyText>::degraded(ExtractedPolicyText{}, e.what());
    }
}

StageResult<std::vector<DamageLabel>> ClaimPipeline::classifyStage(const ClaimSubmission& s) const
{
    std::vector<DamageLabel> unknown(s.evidence_images.size());
    if (s.evidence_images.empty()) return StageResult<std::vector<DamageLabel>>::ok({});
    if (!classifier_) {
        return StageResult<std::vector<DamageLabel>>::degraded(std::move(unknown), "classifier unavailable");
    }

    try {
        std::vector<std::string> images;
        images.reserve(s.evidence_images.size());
        for (const auto& f : s.evidence_images) images.push_back(f.bytes);

        std::vector<DamageLabel> labels = classifier_->classifyAll(images);
        size_t failed = static_cast<size_t>(std::count_if(labels.begin(), labels.end(), [](const DamageLabel& l) {
            return l.label == DamageClass::Unknown;
        }));
        if (failed > 0) {
            return StageResult<std::vector<DamageLabel>>::degraded(
                std::move(labels),
                std::to_string(failed) + " of " + std::to_string(images.size()) + " evidence files could not be classified");
        }
        return StageResult<std::vector<DamageLabel>>::ok(std::move(labels));
    } catch (const std::exception& e) {
        return StageResult<std::vector<DamageLabel>>::degraded(std::move(unknown), e.what());
    }
}

StageResult<FeatureVector> ClaimPipeline::featureStage(const ClaimSubmission& s,
                                                       const std::vector<DamageLabel>& labels,
                                                       const ExtractedPolicyText& policy) const
{
    try {
        return StageResult<FeatureVector>::ok(features_.build(s.form, labels, policy));
    } catch (const std::exception& e) {
        return StageResult<FeatureVector>::degraded(FeatureVector{}, e.what());
    }
}

StageResult<OutcomeEstimate> ClaimPipeline::predictStage(const FeatureVector& fv) const
{
    OutcomeEstimate neutral;
    neutral.score = OutcomePredictor::kNeutralScore;
    neutral.confidence = OutcomePredictor::kLowConfidence;
    if (!predictor_) return StageResult<OutcomeEstimate>::degraded(std::move(neutral), "predictor unavailable");
    try {
        return predictor_->predict(fv);
    } catch (const std::exception& e) {
        return StageResult<OutcomeEstimate>::degraded(std::move(neutral), e.what());
    }
}

StageResult<std::string> ClaimPipeline::synthesizeStage(const ClaimSubmission& s,
                                                        const ExtractedPolicyText& policy,
                                                        const std::optional<int>& predicted) const
{
    if (!synthesizer_) {
        return StageResult<std::string>::degraded(InsightSynthesizer::kFallbackInsight, "synthesizer unavailable");
    }
    try {
        InsightRequest req;
        req.incident_description = s.incident_description;
        req.claim_summary = FeatureBuilder::summarize(s.form);
        req.policy = &policy;
        req.predicted_success = predicted;
        return synthesizer_->synthesize(req);
    } catch (const std::exception& e) {
        return StageResult<std::string>::degraded(InsightSynthesizer::kFallbackInsight, e.what());
    }
}

/* ────────────────────────────────────────────────────────── */
/*  run                                                      */
/* ────────────────────────────────────────────────────────── */
PredictionResult ClaimPipeline::run(const ClaimSubmission& submission, std::vector<State>* trace) const
{
    auto t0 = std::chrono::high_resolution_clock::now();
    PredictionResult result;
    RunLog log(result, trace);
    log.enter(State::Received);

    log.enter(State::Extracting);
    const auto extracted = extractStage(submission);
    const ExtractedPolicyText& policy = log.check(extracted, "extractor");

    log.enter(State::Classifying);
    const auto classified = classifyStage(submission);
    const std::vector<DamageLabel>& labels = log.check(classified, "classifier");

    log.enter(State::FeatureBuilding);
    const auto built = featureStage(submission, labels, policy);
    const FeatureVector& fv = log.check(built, "features");

    log.enter(State::Predicting);
    const auto predicted = predictStage(fv);
    const OutcomeEstimate& estimate = log.check(predicted, "predictor");

    result.prediction = std::clamp(static_cast<int>(std::lround(estimate.score * 100.0)), 0, 100);
    result.confidence = std::clamp(static_cast<int>(std::lround(estimate.confidence * 100.0)), 0, 100);
    result.confidence_score = std::round(result.prediction * result.confidence / 10.0) / 10.0;
    if (!predicted.isDegraded()) result.key_factors = estimate.key_factors;

    log.enter(State::Synthesizing);
    std::optional<int> score_for_prompt;
    if (!predicted.isDegraded()) score_for_prompt = result.prediction;
    const auto insight = synthesizeStage(submission, policy, score_for_prompt);
    result.ai_insights = log.check(insight, "insights");

    if (result.degraded) log.enter(State::DegradedComplete);
    log.enter(State::Complete);
    result.final_state = toString(log.state());

    auto t1 = std::chrono::high_resolution_clock::now();
    CROW_LOG_INFO << "[pipeline] prediction=" << result.prediction << "% confidence=" << result.confidence
                  << "% degraded=" << (result.degraded ? "yes" : "no") << " in "
                  << std::chrono::duration<double, std::milli>(t1 - t0).count() << " ms";
    return result;
}
