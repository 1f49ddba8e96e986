#ifndef PIIANON_CORE_PIPELINE_STATE_HPP
#define PIIANON_CORE_PIPELINE_STATE_HPP

#include <stdexcept>
#include <string>

/**
 * @file pipeline_state.hpp
 * @brief Lifecycle of one Pipeline::process() call.
 *
 *   Idle -> Normalizing -> Detecting -> Filtering -> Reconciling -> Anonymizing
 *        -> [SecondPassDetecting -> SecondPassAnonymizing] -> Done
 *
 * Failed is reachable from every state except Done and Failed.
 */

namespace piianon {
namespace core {

enum class PipelineState {
    Idle,
    Normalizing,
    Detecting,
    Filtering,
    Reconciling,
    Anonymizing,
    SecondPassDetecting,
    SecondPassAnonymizing,
    Done,
    Failed
};

inline const char* stateName(PipelineState s)
{
    switch (s) {
        case PipelineState::Idle:                  return "Idle";
        case PipelineState::Normalizing:           return "Normalizing";
        case PipelineState::Detecting:             return "Detecting";
        case PipelineState::Filtering:             return "Filtering";
        case PipelineState::Reconciling:           return "Reconciling";
        case PipelineState::Anonymizing:           return "Anonymizing";
        case PipelineState::SecondPassDetecting:   return "SecondPassDetecting";
        case PipelineState::SecondPassAnonymizing: return "SecondPassAnonymizing";
        case PipelineState::Done:                  return "Done";
        case PipelineState::Failed:                return "Failed";
    }
    return "Unknown";
}

inline bool isTerminal(PipelineState s)
{
    return s == PipelineState::Done || s == PipelineState::Failed;
}

inline bool isLegalTransition(PipelineState from, PipelineState to)
{
    if (to == PipelineState::Failed) {
        return !isTerminal(from);
    }
    switch (from) {
        case PipelineState::Idle:
            return to == PipelineState::Normalizing;
        case PipelineState::Normalizing:
            return to == PipelineState::Detecting;
        case PipelineState::Detecting:
            return to == PipelineState::Filtering;
        case PipelineState::Filtering:
            return to == PipelineState::Reconciling;
        case PipelineState::Reconciling:
            return to == PipelineState::Anonymizing;
        case PipelineState::Anonymizing:
            return to == PipelineState::SecondPassDetecting || to == PipelineState::Done;
        case PipelineState::SecondPassDetecting:
            return to == PipelineState::SecondPassAnonymizing;
        case PipelineState::SecondPassAnonymizing:
            return to == PipelineState::Done;
        case PipelineState::Done:
        case PipelineState::Failed:
            return false;
    }
    return false;
}

class PipelineStateMachine
{
public:
    PipelineStateMachine() = default;

    /// Resume a run that stopped in @p current.
    explicit PipelineStateMachine(PipelineState current)
        : state_(current)
    {
    }

    PipelineState state() const { return state_; }

    /**
     * @throw std::logic_error on an illegal transition.
     */
    void advance(PipelineState to)
    {
        if (!isLegalTransition(state_, to)) {
            throw std::logic_error(std::string("PipelineState: illegal transition ") + stateName(state_) +
                                   " -> " + stateName(to));
        }
        state_ = to;
    }

    void fail() { advance(PipelineState::Failed); }

private:
    PipelineState state_ = PipelineState::Idle;
};

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_PIPELINE_STATE_HPP
