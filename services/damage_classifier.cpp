#include "damage_classifier.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>
#include <crow/logging.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

/* ────────────────────────────────────────────────────────── */
/*  Shared preprocessing / decision                          */
/* ────────────────────────────────────────────────────────── */
std::vector<float> DamageClassifier::preprocess(const cv::Mat& bgr)
{
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

    // Resize shorter side to 256, then centre crop 224x224.
    const double scale = static_cast<double>(RESIZE_SHORT) / std::min(rgb.cols, rgb.rows);
    const int w = std::max(INPUT_SIZE, static_cast<int>(std::lround(rgb.cols * scale)));
    const int h = std::max(INPUT_SIZE, static_cast<int>(std::lround(rgb.rows * scale)));
    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(w, h), 0, 0, cv::INTER_LINEAR);

    const cv::Rect crop((w - INPUT_SIZE) / 2, (h - INPUT_SIZE) / 2, INPUT_SIZE, INPUT_SIZE);
    cv::Mat patch;
    resized(crop).convertTo(patch, CV_32FC3, 1.0 / 255.0);

    const size_t plane = static_cast<size_t>(INPUT_SIZE) * INPUT_SIZE;
    std::vector<float> tensor(3 * plane);
    for (int y = 0; y < INPUT_SIZE; ++y) {
        const cv::Vec3f* row = patch.ptr<cv::Vec3f>(y);
        for (int x = 0; x < INPUT_SIZE; ++x) {
            for (int c = 0; c < 3; ++c) {
                tensor[c * plane + static_cast<size_t>(y) * INPUT_SIZE + x] = (row[x][c] - MEAN[c]) / STD[c];
            }
        }
    }
    return tensor;
}

DamageLabel DamageClassifier::classify(const std::string& image_bytes) const
{
    DamageLabel unknown;
    if (image_bytes.empty()) return unknown;

    try {
        std::vector<uchar> buffer(image_bytes.begin(), image_bytes.end());
        cv::Mat img = cv::imdecode(buffer, cv::IMREAD_COLOR);
        if (img.empty()) {
            CROW_LOG_WARNING << "[classifier] could not decode evidence image (" << image_bytes.size() << " bytes)";
            return unknown;
        }

        std::vector<float> logits = infer(preprocess(img));
        if (logits.size() != 2 || !std::isfinite(logits[0]) || !std::isfinite(logits[1])) {
            CROW_LOG_WARNING << "[classifier] unexpected model output of size " << logits.size();
            return unknown;
        }

        // softmax over {damage, no_damage}
        const float m = std::max(logits[0], logits[1]);
        const float e0 = std::exp(logits[0] - m);
        const float e1 = std::exp(logits[1] - m);
        const float p_damage = e0 / (e0 + e1);

        DamageLabel out;
        if (p_damage >= 0.5f) {
            out.label = DamageClass::Damage;
            out.confidence = p_damage;
        } else {
            out.label = DamageClass::NoDamage;
            out.confidence = 1.0f - p_damage;
        }
        return out;
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "[classifier] inference failed: " << e.what();
        return unknown;
    }
}

std::vector<DamageLabel> DamageClassifier::classifyAll(const std::vector<std::string>& images) const
{
    std::vector<DamageLabel> results(images.size());
    if (images.empty()) return results;

    int batch_size = static_cast<int>(images.size());
    int num_threads = static_cast<int>(std::thread::hardware_concurrency());
    num_threads = std::clamp(num_threads, 1, 8);
    int step = (batch_size + num_threads - 1) / num_threads;

    std::vector<std::future<void>> futures;
    for (int i = 0; i < batch_size; i += step) {
        int end = std::min(i + step, batch_size);
        futures.emplace_back(std::async(std::launch::async, [&, i, end]() {
            for (int b = i; b < end; ++b) {
                results[b] = classify(images[b]);
            }
        }));
    }
    for (auto& fut : futures) fut.get();

    return results;
}

/* ────────────────────────────────────────────────────────── */
/*  ONNX Runtime backend                                     */
/* ────────────────────────────────────────────────────────── */
OnnxDamageClassifier::OnnxDamageClassifier(const std::string& model_path,
                                           const std::string& execution_provider,
                                           int intra_op_threads)
    : model_path_(model_path)
{
    ort_env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "Claim_Damage_Classifier");
    session_options_ = std::make_unique<Ort::SessionOptions>();
    session_options_->SetIntraOpNumThreads(intra_op_threads);
    session_options_->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    if (execution_provider == "auto") {
        auto providers = Ort::GetAvailableProviders();
        if (std::find(providers.begin(), providers.end(), "CUDAExecutionProvider") != providers.end()) {
            try {
                OrtCUDAProviderOptions cuda_options{};
                session_options_->AppendExecutionProvider_CUDA(cuda_options);
                provider_ = "cuda";
            } catch (const Ort::Exception& e) {
                CROW_LOG_WARNING << "[classifier] CUDA provider rejected, using CPU: " << e.what();
            }
        }
    }

    ort_session_ = std::make_unique<Ort::Session>(*ort_env_, model_path.c_str(), *session_options_);
    memory_info_ = std::make_unique<Ort::MemoryInfo>(
        Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));

    Ort::AllocatorWithDefaultOptions allocator;
    input_name_ = ort_session_->GetInputNameAllocated(0, allocator).get();
    output_name_ = ort_session_->GetOutputNameAllocated(0, allocator).get();

    CROW_LOG_INFO << "[classifier] loaded " << model_path << " on " << provider_;
}

std::string OnnxDamageClassifier::description() const
{
    return "resnet50 damage/no_damage (" + model_path_ + ", " + provider_ + ")";
}

std::vector<float> OnnxDamageClassifier::infer(const std::vector<float>& nchw) const
{
    std::vector<int64_t> input_shape{1, 3, INPUT_SIZE, INPUT_SIZE};
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        *memory_info_, const_cast<float*>(nchw.data()), nchw.size(),
        input_shape.data(), input_shape.size());

    const char* input_names[] = {input_name_.c_str()};
    const char* output_names[] = {output_name_.c_str()};

    auto output_tensors = ort_session_->Run(
        Ort::RunOptions{nullptr}, input_names, &input_tensor, 1, output_names, 1);

    const float* data = output_tensors[0].GetTensorData<float>();
    size_t count = output_tensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
    return std::vector<float>(data, data + count);
}
