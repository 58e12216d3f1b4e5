#include "prediction_controller.h"
#include <crow/multipart.h>
#include <rapidjson/error/en.h>
#include "../services/gemini_client.h"
#include "../services/llama_client.h"
#include "../services/poppler_backend.h"
#include "../services/tesseract_engine.h"

std::shared_ptr<const ClaimPipeline> PredictionController::pipeline_ = nullptr;

/* ────────────────────────────────────────────────────────── */
/*  INIT / CLEANUP                                           */
/* ────────────────────────────────────────────────────────── */
bool PredictionController::initialize(const AppConfig& cfg)
{
    std::shared_ptr<const OutcomePredictor> predictor;
    std::shared_ptr<const DamageClassifier> classifier;
    try {
        auto model = std::make_shared<const LinearModel>(LinearModel::loadFile(cfg.predictor_model_path));
        predictor = std::make_shared<const OutcomePredictor>(model);
        CROW_LOG_INFO << "Outcome model loaded: " << cfg.predictor_model_path
                      << " (" << model->featureCount() << " weights)";

        classifier = std::make_shared<const OnnxDamageClassifier>(
            cfg.classifier_model_path, cfg.classifier_execution_provider, cfg.classifier_threads);
    } catch (const std::exception& e) {
        CROW_LOG_CRITICAL << "Model initialisation failed: " << e.what();
        return false;
    }

    ExtractorOptions opts;
    opts.meaningful_threshold = cfg.meaningful_threshold;
    opts.ocr_max_pages = cfg.ocr_max_pages;
    opts.ocr_dpi = cfg.ocr_dpi;
    auto extractor = std::make_shared<const DocumentExtractor>(
        std::make_shared<const PopplerPdfBackend>(),
        std::make_shared<const TesseractOcrEngine>(cfg.tessdata_path, cfg.ocr_language),
        opts);

    std::shared_ptr<const LanguageModelClient> client;
    if (cfg.insights_backend == "gemini") {
        if (cfg.gemini_api_key.empty()) {
            CROW_LOG_WARNING << "GOOGLE_API_KEY not set, AI insights disabled";
        } else {
            client = std::make_shared<const GeminiClient>(cfg.gemini_api_key, cfg.gemini_model, cfg.gemini_endpoint);
        }
    } else if (cfg.insights_backend == "llama") {
        auto llama = std::make_shared<LlamaClient>();
        if (llama->initializeLlama(cfg.llama_model_path)) {
            client = llama;
        } else {
            CROW_LOG_WARNING << "Local language model unavailable, AI insights disabled";
        }
    } else if (cfg.insights_backend != "none") {
        CROW_LOG_WARNING << "Unknown insights backend '" << cfg.insights_backend << "', AI insights disabled";
    }
    auto synthesizer = std::make_shared<const InsightSynthesizer>(
        client, std::chrono::milliseconds(cfg.insights_timeout_ms));

    initialize(std::make_shared<const ClaimPipeline>(extractor, classifier, predictor, synthesizer));
    return true;
}

void PredictionController::initialize(std::shared_ptr<const ClaimPipeline> pipeline)
{
    pipeline_ = std::move(pipeline);
    CROW_LOG_INFO << "PredictionController ready";
}

void PredictionController::cleanup() { pipeline_.reset(); }

/* ────────────────────────────────────────────────────────── */
/*  ROUTES                                                   */
/* ────────────────────────────────────────────────────────── */
void PredictionController::setupRoutes(crow::SimpleApp& app)
{
    CROW_ROUTE(app, "/advanced/claim").methods("POST"_method)([](const crow::request& r){
        return predict(r);
    });
    CROW_ROUTE(app, "/predict").methods("POST"_method)([](const crow::request& r){
        return predict(r);
    });
    CROW_ROUTE(app, "/model/info").methods("GET"_method)([](){
        return getModelInfo();
    });
}

/* ────────────────────────────────────────────────────────── */
/*  request parsing                                          */
/* ────────────────────────────────────────────────────────── */
ClaimForm PredictionController::parseForm(const std::string& json, std::vector<std::string>& notes)
{
    ClaimForm form;
    rapidjson::Document d;
    d.Parse(json.c_str());
    if (d.HasParseError()) {
        notes.push_back(std::string("form_data_json ignored: ") + rapidjson::GetParseError_En(d.GetParseError()));
        return form;
    }
    if (!d.IsObject()) {
        notes.push_back("form_data_json ignored: not a JSON object");
        return form;
    }

    for (auto& m : d.GetObject()) {
        const auto& v = m.value;
        FormValue fv;
        if (v.IsBool()) {
            fv = FormValue(v.GetBool());
        } else if (v.IsNumber()) {
            fv = FormValue(v.GetDouble());
        } else if (v.IsString()) {
            fv = FormValue(std::string(v.GetString(), v.GetStringLength()));
        } else if (!v.IsNull()) {
            // nested arrays/objects are kept as their JSON text
            rapidjson::StringBuffer buf;
            rapidjson::Writer<rapidjson::StringBuffer> wr(buf);
            v.Accept(wr);
            fv = FormValue(std::string(buf.GetString(), buf.GetSize()));
        }
        form[m.name.GetString()] = std::move(fv);
    }
    return form;
}

std::optional<ClaimSubmission> PredictionController::parseSubmission(const crow::request& req,
                                                                     std::vector<std::string>& notes)
{
    const std::string& content_type = req.get_header_value("Content-Type");
    if (content_type.find("multipart/form-data") == std::string::npos ||
        content_type.find("boundary=") == std::string::npos) {
        return std::nullopt;
    }

    crow::multipart::message msg(req);
    ClaimSubmission s;
    bool form_seen = false;

    for (const auto& part : msg.parts) {
        const auto& disp = part.get_header_object("Content-Disposition");
        auto name_it = disp.params.find("name");
        if (name_it == disp.params.end()) continue;
        const std::string& name = name_it->second;

        if (name == "form_data_json") {
            s.form = parseForm(part.body, notes);
            form_seen = true;
        } else if (name == "policy_document") {
            if (!part.body.empty()) s.policy_document = part.body;
        } else if (name == "evidence_files") {
            if (part.body.empty()) continue;
            auto fn = disp.params.find("filename");
            s.evidence_images.push_back({fn != disp.params.end() ? fn->second : std::string(), part.body});
        }
    }
    if (!form_seen) notes.push_back("form_data_json missing: using defaults");

    for (const char* key : {"incident_description", "incidentDescription", "description"}) {
        auto it = s.form.find(key);
        if (it == s.form.end()) continue;
        if (it->second.isString()) {
            s.incident_description = std::get<std::string>(it->second.value);
        } else {
            s.incident_description = form::toText(it->second);
        }
        if (!s.incident_description.empty()) break;
    }
    return s;
}

std::string PredictionController::toJson(const PredictionResult& r)
{
    rapidjson::Document d; d.SetObject();
    auto& a = d.GetAllocator();

    d.AddMember("prediction", r.prediction, a);
    d.AddMember("confidence", r.confidence, a);
    d.AddMember("confidence_score", r.confidence_score, a);

    rapidjson::Value factors(rapidjson::kArrayType);
    for (const auto& f : r.key_factors) factors.PushBack(rapidjson::Value(f.c_str(), a), a);
    d.AddMember("key_factors", factors, a);

    d.AddMember("ai_insights", rapidjson::Value(r.ai_insights.c_str(), a), a);

    rapidjson::Value diags(rapidjson::kArrayType);
    for (const auto& n : r.diagnostics) diags.PushBack(rapidjson::Value(n.c_str(), a), a);
    d.AddMember("diagnostics", diags, a);

    return stringify(d);
}

/* ────────────────────────────────────────────────────────── */
/*  /advanced/claim                                          */
/* ────────────────────────────────────────────────────────── */
crow::response PredictionController::predict(const crow::request& req)
{
    rapidjson::Document doc; doc.SetObject();
    auto& a = doc.GetAllocator();

    /* sanity check */
    if (!pipeline_) {
        doc.AddMember("error", "prediction pipeline not initialised", a);
        crow::response res(500, stringify(doc));
        res.add_header("Content-Type", "application/json");
        return res;
    }

    std::vector<std::string> notes;
    std::optional<ClaimSubmission> submission;
    try {
        submission = parseSubmission(req, notes);
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "multipart parsing failed: " << e.what();
    }
    if (!submission) {
        doc.AddMember("error", "expected multipart/form-data", a);
        crow::response res(400, stringify(doc));
        res.add_header("Content-Type", "application/json");
        return res;
    }

    CROW_LOG_INFO << "Claim prediction: " << submission->form.size() << " form fields, "
                  << submission->evidence_images.size() << " evidence files, policy="
                  << (submission->policy_document ? "yes" : "no");

    PredictionResult result;
    try {
        result = pipeline_->run(*submission);
    } catch (const std::exception& e) {
        // run() does not throw; this keeps the response contract if it ever does.
        CROW_LOG_ERROR << "pipeline escaped with: " << e.what();
        result.ai_insights = InsightSynthesizer::kFallbackInsight;
        result.diagnostics.push_back(std::string("pipeline: ") + e.what());
    }
    result.diagnostics.insert(result.diagnostics.begin(), notes.begin(), notes.end());

    crow::response res(200, toJson(result));
    res.add_header("Content-Type", "application/json");
    return res;
}

/* ────────────────────────────────────────────────────────── */
/*  /model/info                                              */
/* ────────────────────────────────────────────────────────── */
crow::response PredictionController::getModelInfo()
{
    rapidjson::Document d; d.SetObject();
    auto& a = d.GetAllocator();

    if (!pipeline_) {
        d.AddMember("error", "prediction pipeline not initialised", a);
        crow::response res(500, stringify(d));
        res.add_header("Content-Type", "application/json");
        return res;
    }

    d.AddMember("model_loaded", true, a);
    d.AddMember("model_type", "motor claim outcome predictor", a);
    if (const auto* c = pipeline_->classifier()) {
        d.AddMember("classifier", rapidjson::Value(c->description().c_str(), a), a);
    }
    if (const auto* p = pipeline_->predictor()) {
        d.AddMember("predictor_version", rapidjson::Value(p->model().version.c_str(), a), a);
        d.AddMember("predictor_weights", static_cast<uint64_t>(p->model().featureCount()), a);
    }
    if (const auto* s = pipeline_->synthesizer()) {
        d.AddMember("insights_backend", rapidjson::Value(s->backendName().c_str(), a), a);
    }

    rapidjson::Value arr(rapidjson::kArrayType);
    arr.PushBack("image/jpeg", a).PushBack("image/png", a).PushBack("application/pdf", a);
    d.AddMember("supported_formats", arr, a);

    crow::response res(200, stringify(d));
    res.add_header("Content-Type", "application/json");
    return res;
}

/* ────────────────────────────────────────────────────────── */
/*  helper: stringify rapidjson::Document                    */
/* ────────────────────────────────────────────────────────── */
std::string PredictionController::stringify(const rapidjson::Document& d)
{
    rapidjson::StringBuffer buf;
    rapidjson::Writer<rapidjson::StringBuffer> wr(buf);
    d.Accept(wr);
    return { buf.GetString(), buf.GetSize() };
}
