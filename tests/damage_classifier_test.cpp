#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>

#include "services/damage_classifier.h"

namespace {

// Runs the shared decode/preprocess path with scripted logits.
class ScriptedClassifier : public DamageClassifier
{
public:
    std::vector<float> logits{2.0f, -1.0f};
    bool throws = false;
    mutable std::atomic<int> calls{0};

    std::string description() const override { return "scripted"; }

protected:
    std::vector<float> infer(const std::vector<float>& nchw) const override
    {
        ++calls;
        if (nchw.size() != 3u * INPUT_SIZE * INPUT_SIZE) throw std::runtime_error("bad tensor size");
        if (throws) throw std::runtime_error("session run failed");
        return logits;
    }
};

std::string encodedImage(int w, int h, const cv::Scalar& colour)
{
    cv::Mat img(h, w, CV_8UC3, colour);
    std::vector<uchar> buf;
    bool ok = cv::imencode(".png", img, buf);
    assert(ok);
    return std::string(buf.begin(), buf.end());
}

void testPreprocessShape()
{
    cv::Mat wide(300, 640, CV_8UC3, cv::Scalar(0, 0, 255));      // pure red in BGR
    std::vector<float> t = DamageClassifier::preprocess(wide);
    assert(t.size() == 3u * 224 * 224);

    // Channel 0 is R after the BGR->RGB swap.
    const float red = (1.0f - DamageClassifier::MEAN[0]) / DamageClassifier::STD[0];
    const float blue = (0.0f - DamageClassifier::MEAN[2]) / DamageClassifier::STD[2];
    assert(std::fabs(t[0] - red) < 1e-3f);
    assert(std::fabs(t[2 * 224 * 224] - blue) < 1e-3f);
    std::cout << "[PASS] preprocess produces normalised NCHW" << std::endl;
}

void testDamageDecision()
{
    ScriptedClassifier c;
    std::string photo = encodedImage(320, 240, cv::Scalar(40, 80, 120));

    DamageLabel d = c.classify(photo);
    assert(d.label == DamageClass::Damage);
    assert(d.confidence > 0.9f && d.confidence <= 1.0f);

    c.logits = {-1.0f, 1.0f};
    DamageLabel n = c.classify(photo);
    assert(n.label == DamageClass::NoDamage);
    assert(n.confidence > 0.5f);
    std::cout << "[PASS] arg-max over softmax" << std::endl;
}

void testUnreadableInputIsUnknown()
{
    ScriptedClassifier c;
    DamageLabel empty = c.classify("");
    assert(empty.label == DamageClass::Unknown && empty.confidence == 0.0f);

    DamageLabel corrupt = c.classify("\xff\xd8\xff\xe0 truncated jpeg");
    assert(corrupt.label == DamageClass::Unknown && corrupt.confidence == 0.0f);

    DamageLabel pdf = c.classify("%PDF-1.4 not an image");
    assert(pdf.label == DamageClass::Unknown);
    assert(c.calls == 0 && "nothing decodable reached the network");
    std::cout << "[PASS] undecodable input is unknown" << std::endl;
}

void testInferenceFailureIsUnknown()
{
    ScriptedClassifier c;
    c.throws = true;
    DamageLabel l = c.classify(encodedImage(64, 64, cv::Scalar(10, 10, 10)));
    assert(l.label == DamageClass::Unknown && l.confidence == 0.0f);

    c.throws = false;
    c.logits = {1.0f};
    assert(c.classify(encodedImage(64, 64, cv::Scalar(10, 10, 10))).label == DamageClass::Unknown);
    std::cout << "[PASS] inference failure is unknown" << std::endl;
}

void testClassifyAllKeepsOrder()
{
    ScriptedClassifier c;
    std::string good = encodedImage(100, 80, cv::Scalar(1, 2, 3));
    std::vector<std::string> batch;
    for (int i = 0; i < 20; ++i) batch.push_back(i % 3 == 1 ? std::string("garbage") : good);

    std::vector<DamageLabel> labels = c.classifyAll(batch);
    assert(labels.size() == batch.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        DamageClass expected = (i % 3 == 1) ? DamageClass::Unknown : DamageClass::Damage;
        assert(labels[i].label == expected);
    }
    assert(c.classifyAll({}).empty());
    std::cout << "[PASS] batch classification keeps input order" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] DamageClassifier..." << std::endl;
    testPreprocessShape();
    testDamageDecision();
    testUnreadableInputIsUnknown();
    testInferenceFailureIsUnknown();
    testClassifyAllKeepsOrder();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
