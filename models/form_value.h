#pragma once
#include <map>
#include <string>
#include <variant>

// Raw value of a claim-form field as it arrived in form_data_json.
// The web form sends the same logical field as a number, a string or a
// bool depending on the widget, so nothing downstream may assume a type.
struct FormValue
{
    std::variant<std::monostate, bool, double, std::string> value;

    FormValue() = default;
    FormValue(bool b) : value(b) {}
    FormValue(int n) : value(static_cast<double>(n)) {}
    FormValue(double d) : value(d) {}
    FormValue(const char* s) : value(std::string(s)) {}
    FormValue(std::string s) : value(std::move(s)) {}

    bool isNull()   const { return std::holds_alternative<std::monostate>(value); }
    bool isBool()   const { return std::holds_alternative<bool>(value); }
    bool isNumber() const { return std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

using ClaimForm = std::map<std::string, FormValue>;
