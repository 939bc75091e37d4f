#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// ── Decision variants ──

struct NoChange {};

struct TimeBorrow {
    int64_t frontMs = 0;    // taken from the gap before the cue
    int64_t backMs = 0;     // taken from the gap after the cue
    bool partial = false;   // all available slack granted, still possibly short
};

struct NeedEscalation {
    int64_t shortfallMs = 0;
    int64_t minRequiredMs = 0;
};

// Malformed cue dropped from the optimized list.
struct Rejected {
    std::string reason;
};

using TimingAction = std::variant<NoChange, TimeBorrow, NeedEscalation, Rejected>;

// One audit-trail record. A partially satisfied cue gets two records:
// a TimeBorrow followed by a NeedEscalation.
struct TimingDecision {
    size_t position = 0;    // position in the input list
    int cueIndex = 0;
    TimingAction action;
};

const char* decisionName(const TimingAction& action);

// "borrow front=120 back=80 partial" style one-liner for logs and reports.
std::string describeDecision(const TimingDecision& d);
