#include <algorithm>
#include <cmath>
#include <limits>
#include <stagehand/error.hpp>
#include <stagehand/logger.hpp>
#include <stagehand/timeline.hpp>
#include <string>

namespace stagehand
{

namespace
{

constexpr float UNBOUNDED = std::numeric_limits<float>::infinity();

}  // anonymous namespace

Timeline::Timeline(State origin)
    : origin_(std::move(origin)), terminal_(std::make_unique<StopAction>(origin_, UNBOUNDED))
{
}

void Timeline::check_duration(float duration)
{
    if (!std::isfinite(duration) || duration < 0.0f)
    {
        STAGEHAND_LOG_WARN("timeline", "rejected action with duration {}", duration);
        throw InvalidDurationError("action duration must be finite and >= 0, got " +
                                   std::to_string(duration));
    }
}

// Everything that can throw happens before the first mutation.
void Timeline::push(std::unique_ptr<Action> action, std::optional<float> exact_end)
{
    State end_state = action->state_after(action->duration());

    actions_.reserve(actions_.size() + 1);
    starts_.reserve(starts_.size() + 1);

    STAGEHAND_LOG_TRACE("timeline",
                        "append {} [{}, {})",
                        action->type(),
                        end_time_,
                        end_time_ + action->duration());

    starts_.push_back(end_time_);
    end_time_ = exact_end ? *exact_end : end_time_ + action->duration();
    actions_.push_back(std::move(action));
    terminal_->hold(std::move(end_state));
}

const Action& Timeline::append(ActionKind kind, float duration, const Destination& destination)
{
    check_duration(duration);
    auto  action = make_action(kind, final_state(), duration, destination);
    auto& ref    = *action;
    push(std::move(action));
    return ref;
}

void Timeline::pad_to(float end_time)
{
    if (!(end_time > end_time_))
    {
        return;
    }
    check_duration(end_time - end_time_);
    push(std::make_unique<StopAction>(final_state(), end_time - end_time_), end_time);
}

bool Timeline::rebase(const State& origin)
{
    if (!actions_.empty())
    {
        return false;
    }
    State next = origin;
    State held = origin;
    origin_    = std::move(next);
    terminal_->hold(std::move(held));
    return true;
}

Timeline::Resolved Timeline::resolve(float t) const
{
    if (std::isnan(t) || t < 0.0f)
    {
        throw OutOfRangeQueryError("timeline queried at negative time " + std::to_string(t));
    }

    if (t >= end_time_)
    {
        return Resolved{*terminal_, end_time_, t - end_time_, std::nullopt};
    }

    // Last action starting at or before t. Zero-length actions share their
    // start with the next action, so upper_bound skips past them.
    auto   it    = std::upper_bound(starts_.begin(), starts_.end(), t);
    size_t index = static_cast<size_t>(it - starts_.begin()) - 1;
    return Resolved{*actions_[index], starts_[index], t - starts_[index], index};
}

State Timeline::state_at(float t) const
{
    auto r = resolve(t);
    return r.action.state_after(r.local_elapsed);
}

}  // namespace stagehand
