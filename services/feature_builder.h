#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include "../models/claim_types.h"

// Coercion helpers. Every value read from the claim form goes through one
// of these before any type-specific operation is applied to it.
namespace form {

// Stringify then lower-case and trim. Null becomes "".
std::string toText(const FormValue& v);

// yes / y / true / on / 1 / within-24h and non-zero numbers are true.
bool toFlag(const FormValue& v);

// Leading number of a text value ("13+" -> 13, "0-3" -> 0), bools as 0/1.
std::optional<double> toNumber(const FormValue& v);

int toInt(const FormValue& v, int fallback);
double toDouble(const FormValue& v, double fallback);

} // namespace form

class FeatureBuilder
{
public:
    FeatureVector build(const ClaimForm& form,
                        const std::vector<DamageLabel>& labels,
                        const ExtractedPolicyText& policy) const;

    // All form fields as "key: value" lines, sorted by key.
    static std::string summarize(const ClaimForm& form);

    static DamageSeverity parseSeverity(const std::string& text);
    static std::string timeOfDayFromClock(const std::string& hhmm);

private:
    const FormValue* lookup(const ClaimForm& form, std::initializer_list<const char*> keys) const;
};
