#pragma once
#include <string>
#include <utility>

// Outcome of one pipeline stage: either the primary value, or a fallback
// value produced after the primary method failed, together with the reason.
template <typename T>
class StageResult
{
public:
    static StageResult ok(T value) { return StageResult(std::move(value), false, {}); }

    static StageResult degraded(T fallback, std::string reason)
    {
        return StageResult(std::move(fallback), true, std::move(reason));
    }

    bool isDegraded() const { return degraded_; }
    const std::string& reason() const { return reason_; }

    const T& value() const& { return value_; }
    T&& value() && { return std::move(value_); }

private:
    StageResult(T value, bool degraded, std::string reason)
        : value_(std::move(value)), degraded_(degraded), reason_(std::move(reason)) {}

    T value_;
    bool degraded_;
    std::string reason_;
};
