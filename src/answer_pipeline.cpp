#include "parley/answer_pipeline.hpp"

#include "parley/session.hpp"
#include "parley/template_engine.hpp"

namespace parley {

namespace {

ResponseKey KeyFor(Recoverable error) {
    switch (error) {
        case Recoverable::NotValid: return ResponseKey::NotValid;
        case Recoverable::NotInRange: return ResponseKey::NotInRange;
        case Recoverable::InvalidType: return ResponseKey::InvalidType;
        case Recoverable::NoCompletion: return ResponseKey::NoCompletion;
        case Recoverable::AmbiguousCompletion: return ResponseKey::AmbiguousCompletion;
        case Recoverable::Declined: break;
    }
    return ResponseKey::NotValid;
}

} // namespace

const char* PipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Render: return "render";
        case PipelineState::Read: return "read";
        case PipelineState::Validate: return "validate";
        case PipelineState::Convert: return "convert";
        case PipelineState::RangeCheck: return "range_check";
        case PipelineState::Confirm: return "confirm";
        case PipelineState::Done: return "done";
        case PipelineState::Error: return "error";
    }
    return "unknown";
}

Answer AnswerPipeline::Run() {
    retries_ = 0;
    PipelineState state = PipelineState::Render;
    std::string raw;
    Answer pending;
    Recoverable error = Recoverable::NotValid;

    while (true) {
        switch (state) {
            case PipelineState::Render:
                Render();
                state = PipelineState::Read;
                break;
            case PipelineState::Read:
                raw = question_.AnswerOrDefault(session_.ReadResponse(question_));
                state = PipelineState::Validate;
                break;
            case PipelineState::Validate:
                if (question_.ValidAnswer(raw)) {
                    state = PipelineState::Convert;
                } else {
                    error = Recoverable::NotValid;
                    state = PipelineState::Error;
                }
                break;
            case PipelineState::Convert: {
                ConvertOutcome outcome = question_.Convert(raw);
                if (outcome.ok()) {
                    pending = outcome.value;
                    state = PipelineState::RangeCheck;
                } else {
                    error = *outcome.error;
                    state = PipelineState::Error;
                }
                break;
            }
            case PipelineState::RangeCheck:
                if (!question_.InRange(pending)) {
                    error = Recoverable::NotInRange;
                    state = PipelineState::Error;
                } else if (question_.confirm() != ConfirmMode::None) {
                    state = PipelineState::Confirm;
                } else {
                    state = PipelineState::Done;
                }
                break;
            case PipelineState::Confirm:
                if (Confirmed(pending)) {
                    state = PipelineState::Done;
                } else {
                    error = Recoverable::Declined;
                    state = PipelineState::Error;
                }
                break;
            case PipelineState::Done:
                return pending;
            case PipelineState::Error:
                ++retries_;
                ExplainError(error);
                // The ask_on_error directive already re-rendered what it wants.
                state = PipelineState::Read;
                break;
        }
    }
}

void AnswerPipeline::Render() {
    TemplateContext context = session_.BaseContext();
    question_.FillTemplate(context);
    session_.Say(question_.Render(), context);
}

void AnswerPipeline::ExplainError(Recoverable error) {
    TemplateContext context = session_.BaseContext();
    question_.FillTemplate(context);
    if (error != Recoverable::Declined) {
        session_.Say(question_.Response(KeyFor(error)), context);
    }
    switch (question_.ask_on_error()) {
        case AskOnError::Question:
            Render();
            break;
        case AskOnError::Message:
            session_.Say(question_.Response(ResponseKey::AskOnError), context);
            break;
        case AskOnError::Nothing:
            break;
    }
}

bool AnswerPipeline::Confirmed(const Answer& answer) {
    std::string text = "Are you sure?  ";
    if (question_.confirm() == ConfirmMode::Template) {
        TemplateContext context = session_.BaseContext();
        question_.FillTemplate(context);
        context.Set("answer", answer);
        // The expanded text goes through Say() again.
        text = EscapeTags(ExpandTemplate(question_.confirm_text(), context));
    }
    Session nested = session_.Nested();
    return nested.Agree(text);
}

} // namespace parley
