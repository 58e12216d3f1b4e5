#include "claim_types.h"

std::string toString(ExtractionMethod method)
{
    switch (method) {
        case ExtractionMethod::Direct: return "direct";
        case ExtractionMethod::Ocr:    return "ocr";
        case ExtractionMethod::None:   return "none";
    }
    return "none";
}

std::string toString(DamageClass label)
{
    switch (label) {
        case DamageClass::Damage:   return "damage";
        case DamageClass::NoDamage: return "no_damage";
        case DamageClass::Unknown:  return "unknown";
    }
    return "unknown";
}

std::string toString(DamageSeverity severity)
{
    switch (severity) {
        case DamageSeverity::None:      return "none";
        case DamageSeverity::Minor:     return "minor";
        case DamageSeverity::Moderate:  return "moderate";
        case DamageSeverity::Major:     return "major";
        case DamageSeverity::TotalLoss: return "total_loss";
    }
    return "moderate";
}
