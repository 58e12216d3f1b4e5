#pragma once
#include <optional>
#include <string>
#include <vector>
#include "form_value.h"

struct EvidenceFile
{
    std::string filename;
    std::string bytes;
};

// One prediction request. Built by the HTTP layer, read-only afterwards.
struct ClaimSubmission
{
    ClaimForm form;
    std::optional<std::string> policy_document;   // raw PDF bytes
    std::vector<EvidenceFile> evidence_images;
    std::string incident_description;
};

enum class ExtractionMethod { Direct, Ocr, None };

struct ExtractedPolicyText
{
    std::string text;
    ExtractionMethod method = ExtractionMethod::None;
    bool meaningful = false;
    int pages_processed = 0;
    int pages_failed = 0;
};

enum class DamageClass { Damage, NoDamage, Unknown };

struct DamageLabel
{
    DamageClass label = DamageClass::Unknown;
    float confidence = 0.0f;                       // [0,1], 0 for Unknown
};

enum class DamageSeverity { None, Minor, Moderate, Major, TotalLoss };

struct FeatureVector
{
    /* ---------- Incident ---------- */
    std::string incident_type      = "collision";
    std::string time_of_day        = "afternoon";
    std::string weather_conditions = "clear";
    std::string road_conditions    = "dry";

    /* ---------- Driver / vehicle ---------- */
    int    driver_age      = 30;
    int    vehicle_age     = 5;
    int    engine_capacity = 1600;                 // cc
    double market_value    = 25000.0;
    std::string coverage_type = "comprehensive";

    /* ---------- Damage ---------- */
    DamageSeverity damage_severity = DamageSeverity::Moderate;

    /* ---------- Documentation / circumstances ---------- */
    bool police_report       = false;
    bool filed_within_24h    = false;
    bool witnesses           = false;
    bool third_party_vehicle = false;
    bool injuries            = false;
    bool traffic_violation   = false;
    std::string at_fault     = "unknown";          // yes / no / partial / unknown
    int  previous_claims     = 0;

    /* ---------- Evidence aggregate ---------- */
    bool visual_damage_detected = false;
    int  evidence_images = 0;
    int  damage_images   = 0;
    int  unknown_images  = 0;
    bool policy_text_meaningful = false;

    // Core fields that were absent from the form and fell back to a default.
    std::vector<std::string> missing_fields;
};

struct PredictionResult
{
    int prediction = 50;                           // 0-100
    int confidence = 20;                           // 0-100
    double confidence_score = 10.0;                // prediction * confidence / 100
    std::string ai_insights;
    std::vector<std::string> key_factors;
    std::vector<std::string> diagnostics;
    std::string final_state;
    bool degraded = false;
};

std::string toString(ExtractionMethod method);
std::string toString(DamageClass label);
std::string toString(DamageSeverity severity);
