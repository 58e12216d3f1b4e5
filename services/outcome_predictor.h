#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "../models/claim_types.h"
#include "../models/stage_result.h"

// Frozen linear regression exported from the offline training job.
// Categorical features are one-hot: each (feature, category) pair has its
// own weight and categories not seen during training contribute nothing.
struct LinearModel
{
    double intercept = 0.0;
    std::map<std::string, double> numeric;
    std::map<std::string, std::map<std::string, double>> categorical;
    bool percent_scale = true;       // raw output in 0-100 instead of 0-1
    std::string version;

    // Throws std::runtime_error on unreadable or malformed artifacts.
    static LinearModel fromJson(const std::string& json_text);
    static LinearModel loadFile(const std::string& path);

    size_t featureCount() const;
};

struct OutcomeEstimate
{
    double score = 0.5;              // [0,1]
    double confidence = 0.2;         // [0,1], documentation heuristic
    std::vector<std::string> key_factors;
};

class OutcomePredictor
{
public:
    static constexpr double kNeutralScore = 0.5;
    static constexpr double kLowConfidence = 0.2;

    explicit OutcomePredictor(std::shared_ptr<const LinearModel> model);

    StageResult<OutcomeEstimate> predict(const FeatureVector& fv) const;

    // Raw linear response, scaled to [0,1]. Deterministic.
    double score(const FeatureVector& fv) const;

    static double confidence(const FeatureVector& fv);
    static std::vector<std::string> keyFactors(const FeatureVector& fv);

    const LinearModel& model() const { return *model_; }

private:
    std::map<std::string, double> numericInputs(const FeatureVector& fv) const;
    std::map<std::string, std::string> categoricalInputs(const FeatureVector& fv) const;

    std::shared_ptr<const LinearModel> model_;
};
