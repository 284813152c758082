// The ask control loop: render, read, validate, convert, range-check, confirm
#pragma once

#include <optional>
#include <string>

#include "parley/parley_types.hpp"
#include "parley/question.hpp"

namespace parley {

class Session;

enum class PipelineState { Render, Read, Validate, Convert, RangeCheck, Confirm, Done, Error };

PARLEY_API const char* PipelineStateName(PipelineState state);

// Drives one question to an answer. The question is read-only for the whole
// run; only the raw input and pending answer change between retries.
class PARLEY_API AnswerPipeline {
public:
    AnswerPipeline(Session& session, const Question& question)
        : session_(session), question_(question) {}

    // Loops until an answer passes every step. Recoverable conditions are
    // reported and retried; anything else propagates.
    Answer Run();

    // Number of recoverable conditions handled by the last Run().
    size_t retries() const { return retries_; }

private:
    void Render();
    void ExplainError(Recoverable error);
    bool Confirmed(const Answer& answer);

    Session& session_;
    const Question& question_;
    size_t retries_ = 0;
};

} // namespace parley
