#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// One card as reported by the flashcard store.
struct RawReviewRecord {
    long long card_id = 0;
    long long note_id = 0;
    int card_index = 1;          // 1-based cloze / child-card index
    std::string linkage;         // raw linkage block (JSON text), may be empty
    double interval_days = 0.0;
    int lapses = 0;
    int reps = 0;
    std::optional<int> ease_factor;
};

class TelemetryError : public std::runtime_error {
public:
    enum class Kind { Timeout, Other };

    TelemetryError(Kind kind, const std::string& what)
        : std::runtime_error(what), error_kind(kind) {}

    Kind kind() const { return error_kind; }
    bool isTimeout() const { return error_kind == Kind::Timeout; }

private:
    Kind error_kind;
};

class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    // All cards matching the filter. Throws TelemetryError.
    virtual std::vector<RawReviewRecord> query(const std::string& filter) = 0;

    virtual std::string name() const = 0;
};
