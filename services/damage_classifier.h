#pragma once
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include "../models/claim_types.h"

// Labels evidence photos as damage / no_damage. Decoding, preprocessing and
// the arg-max live here; subclasses only run the network.
class DamageClassifier
{
public:
    // ImageNet preprocessing the ResNet backbone was fine-tuned with.
    static constexpr int RESIZE_SHORT = 256;
    static constexpr int INPUT_SIZE = 224;
    static constexpr float MEAN[3] = {0.485f, 0.456f, 0.406f};
    static constexpr float STD[3]  = {0.229f, 0.224f, 0.225f};

    virtual ~DamageClassifier() = default;

    // Never throws: undecodable input or inference failure yields Unknown/0.
    DamageLabel classify(const std::string& image_bytes) const;

    // Independent images classified in parallel; output order matches input.
    std::vector<DamageLabel> classifyAll(const std::vector<std::string>& images) const;

    virtual std::string description() const = 0;

    // Decoded BGR image -> NCHW float tensor data of 3*224*224 values.
    static std::vector<float> preprocess(const cv::Mat& bgr);

protected:
    // Two logits in {damage, no_damage} order.
    virtual std::vector<float> infer(const std::vector<float>& nchw) const = 0;
};

class OnnxDamageClassifier : public DamageClassifier
{
public:
    // Throws on a missing or unreadable model: the service cannot start without it.
    OnnxDamageClassifier(const std::string& model_path,
                         const std::string& execution_provider,
                         int intra_op_threads);

    std::string description() const override;
    const std::string& provider() const { return provider_; }

protected:
    std::vector<float> infer(const std::vector<float>& nchw) const override;

private:
    std::string model_path_;
    std::string provider_ = "cpu";
    std::unique_ptr<Ort::Env> ort_env_;
    std::unique_ptr<Ort::SessionOptions> session_options_;
    std::unique_ptr<Ort::Session> ort_session_;
    std::unique_ptr<Ort::MemoryInfo> memory_info_;
    std::string input_name_;
    std::string output_name_;
};
