#include <cassert>
#include <iostream>
#include <rapidjson/document.h>

#include "controllers/health_controller.h"
#include "controllers/prediction_controller.h"

namespace {

const char* const kBoundary = "----ClaimFormBoundary7MA4YWxk";

struct Part
{
    std::string name;
    std::string filename;
    std::string content_type;
    std::string body;
};

crow::request multipartRequest(const std::vector<Part>& parts)
{
    std::string body;
    for (const auto& p : parts) {
        body += std::string("--") + kBoundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + p.name + "\"";
        if (!p.filename.empty()) body += "; filename=\"" + p.filename + "\"";
        body += "\r\n";
        if (!p.content_type.empty()) body += "Content-Type: " + p.content_type + "\r\n";
        body += "\r\n" + p.body + "\r\n";
    }
    body += std::string("--") + kBoundary + "--\r\n";

    crow::request req;
    req.method = crow::HTTPMethod::Post;
    req.url = "/advanced/claim";
    req.headers.emplace("Content-Type", std::string("multipart/form-data; boundary=") + kBoundary);
    req.body = body;
    return req;
}

bool contains(const std::vector<std::string>& items, const std::string& needle)
{
    for (const auto& s : items) {
        if (s.find(needle) != std::string::npos) return true;
    }
    return false;
}

void testParseFormMixedTypes()
{
    std::vector<std::string> notes;
    ClaimForm form = PredictionController::parseForm(
        R"({"incidentType": "Collision", "driver_age": 28, "witnesses": true,
            "notes": null, "tags": ["a", "b"]})", notes);
    assert(notes.empty());
    assert(std::get<std::string>(form["incidentType"].value) == "Collision");
    assert(std::get<double>(form["driver_age"].value) == 28.0);
    assert(std::get<bool>(form["witnesses"].value));
    assert(form["notes"].isNull());
    assert(std::get<std::string>(form["tags"].value) == R"(["a","b"])");

    ClaimForm bad = PredictionController::parseForm("{\"incidentType\": ", notes);
    assert(bad.empty());
    assert(notes.size() == 1 && contains(notes, "form_data_json ignored"));

    ClaimForm list = PredictionController::parseForm("[1,2,3]", notes);
    assert(list.empty() && notes.size() == 2);
    std::cout << "[PASS] form JSON parsing" << std::endl;
}

void testParseSubmission()
{
    crow::request req = multipartRequest({
        {"form_data_json", "", "", R"({"incidentType": "Theft", "incidentDescription": "Car stolen overnight"})"},
        {"policy_document", "policy.pdf", "application/pdf", "%PDF-1.5 body"},
        {"evidence_files", "front.jpg", "image/jpeg", std::string("\xff\xd8\xff\xe0 jpeg", 9)},
        {"evidence_files", "rear.png", "image/png", "\x89PNG data"},
        {"evidence_files", "empty.jpg", "image/jpeg", ""},
    });

    std::vector<std::string> notes;
    auto s = PredictionController::parseSubmission(req, notes);
    assert(s);
    assert(notes.empty());
    assert(s->form.size() == 2);
    assert(s->incident_description == "Car stolen overnight");
    assert(s->policy_document && *s->policy_document == "%PDF-1.5 body");
    assert(s->evidence_images.size() == 2 && "empty file parts are dropped");
    assert(s->evidence_images[0].filename == "front.jpg");
    assert(s->evidence_images[1].bytes == "\x89PNG data");
    std::cout << "[PASS] multipart submission" << std::endl;
}

void testMissingFormAndNonMultipart()
{
    std::vector<std::string> notes;
    auto s = PredictionController::parseSubmission(
        multipartRequest({{"evidence_files", "a.jpg", "image/jpeg", "xyz"}}), notes);
    assert(s && s->form.empty());
    assert(contains(notes, "form_data_json missing"));

    crow::request json_req;
    json_req.headers.emplace("Content-Type", "application/json");
    json_req.body = "{}";
    notes.clear();
    assert(!PredictionController::parseSubmission(json_req, notes));
    std::cout << "[PASS] missing form and non-multipart request" << std::endl;
}

void testToJson()
{
    PredictionResult r;
    r.prediction = 74;
    r.confidence = 80;
    r.confidence_score = 59.2;
    r.key_factors = {"Timely police report filed within 24 hours"};
    r.ai_insights = "Covered.";
    r.diagnostics = {"insights: timed out"};

    rapidjson::Document d;
    d.Parse(PredictionController::toJson(r).c_str());
    assert(!d.HasParseError());
    assert(d["prediction"].GetInt() == 74);
    assert(d["confidence"].GetInt() == 80);
    assert(d["confidence_score"].GetDouble() == 59.2);
    assert(d["key_factors"].IsArray() && d["key_factors"].Size() == 1);
    assert(std::string(d["ai_insights"].GetString()) == "Covered.");
    assert(d["diagnostics"].Size() == 1);
    std::cout << "[PASS] response JSON" << std::endl;
}

void testPredictEndpoint()
{
    PredictionController::cleanup();
    crow::request req = multipartRequest({{"form_data_json", "", "", "not json"}});
    assert(PredictionController::predict(req).code == 500);

    // No models loaded: every stage reports unavailable but the contract holds.
    auto pipeline = std::make_shared<const ClaimPipeline>(nullptr, nullptr, nullptr, nullptr);
    PredictionController::initialize(pipeline);
    HealthController::initialize(pipeline);

    crow::response res = PredictionController::predict(req);
    assert(res.code == 200);
    rapidjson::Document d;
    d.Parse(res.body.c_str());
    assert(!d.HasParseError());
    assert(d["prediction"].GetInt() == 50);
    assert(std::string(d["ai_insights"].GetString()) == InsightSynthesizer::kFallbackInsight);
    assert(d["diagnostics"].Size() >= 1);
    assert(std::string(d["diagnostics"][0].GetString()).find("form_data_json ignored") == 0);

    crow::request plain;
    plain.headers.emplace("Content-Type", "text/plain");
    plain.body = "hello";
    assert(PredictionController::predict(plain).code == 400);

    rapidjson::Document h;
    h.Parse(HealthController::claimHealth().body.c_str());
    assert(std::string(h["status"].GetString()) == "degraded");
    assert(!h["features"]["classifier"].GetBool());

    PredictionController::cleanup();
    HealthController::initialize(nullptr);
    std::cout << "[PASS] predict endpoint" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] PredictionController..." << std::endl;
    testParseFormMixedTypes();
    testParseSubmission();
    testMissingFormAndNonMultipart();
    testToJson();
    testPredictEndpoint();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
