#pragma once
#include <memory>
#include <string>
#include <vector>
#include "../models/claim_types.h"
#include "damage_classifier.h"
#include "document_extractor.h"
#include "feature_builder.h"
#include "insight_synthesizer.h"
#include "outcome_predictor.h"

struct StageAvailability
{
    bool extractor = false;
    bool ocr = false;
    bool classifier = false;
    bool predictor = false;
    bool synthesizer = false;
};

// Runs one claim through extraction, classification, feature building,
// prediction and insight synthesis. Stages that fail are replaced by their
// fallback values; run() always produces a result.
//
// All collaborators are shared read-only between concurrent runs. A null
// collaborator is treated as an unavailable stage.
class ClaimPipeline
{
public:
    enum class State {
        Received,
        Extracting,
        Classifying,
        FeatureBuilding,
        Predicting,
        Synthesizing,
        DegradedComplete,
        Complete
    };

    ClaimPipeline(std::shared_ptr<const DocumentExtractor> extractor,
                  std::shared_ptr<const DamageClassifier> classifier,
                  std::shared_ptr<const OutcomePredictor> predictor,
                  std::shared_ptr<const InsightSynthesizer> synthesizer);

    // Never throws. When trace is given it receives every state visited.
    PredictionResult run(const ClaimSubmission& submission,
                         std::vector<State>* trace = nullptr) const;

    StageAvailability availability() const;

    static std::string toString(State state);

    const DamageClassifier* classifier() const { return classifier_.get(); }
    const OutcomePredictor* predictor() const { return predictor_.get(); }
    const InsightSynthesizer* synthesizer() const { return synthesizer_.get(); }

private:
    StageResult<ExtractedPolicyText> extractStage(const ClaimSubmission& s) const;
    StageResult<std::vector<DamageLabel>> classifyStage(const ClaimSubmission& s) const;
    StageResult<FeatureVector> featureStage(const ClaimSubmission& s,
                                            const std::vector<DamageLabel>& labels,
                                            const ExtractedPolicyText& policy) const;
    StageResult<OutcomeEstimate> predictStage(const FeatureVector& fv) const;
    StageResult<std::string> synthesizeStage(const ClaimSubmission& s,
                                             const ExtractedPolicyText& policy,
                                             const std::optional<int>& predicted) const;

    std::shared_ptr<const DocumentExtractor> extractor_;
    std::shared_ptr<const DamageClassifier> classifier_;
    std::shared_ptr<const OutcomePredictor> predictor_;
    std::shared_ptr<const InsightSynthesizer> synthesizer_;
    FeatureBuilder features_;
};
