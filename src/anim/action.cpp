#include <algorithm>
#include <stagehand/action.hpp>
#include <stagehand/logger.hpp>
#include <utility>

namespace stagehand
{

std::string_view kind_name(ActionKind kind)
{
    switch (kind)
    {
        case ActionKind::Move:
            return "ActMove";
        case ActionKind::Rotate:
            return "ActRotate";
        case ActionKind::Color:
            return "ActColor";
        case ActionKind::Stop:
            return "ActStop";
    }
    return "Unknown";
}

// ─── Action ─────────────────────────────────────────────────────────────────

Action::Action(std::string type, State start, float duration)
    : type_(std::move(type)), start_state_(std::move(start)), duration_(duration)
{
}

float Action::fraction(float elapsed) const
{
    if (duration_ <= 0.0f)
    {
        return 1.0f;
    }
    return std::clamp(elapsed, 0.0f, duration_) / duration_;
}

State Action::state_after(float elapsed) const
{
    State result = evaluate(std::clamp(elapsed, 0.0f, duration_));

    for (const auto& [key, value] : start_state_.custom)
    {
        if (!result.has(key))
        {
            STAGEHAND_LOG_ERROR("timeline", "{} action dropped state key '{}'", type_, key);
            throw UnknownKeyError(key);
        }
    }
    return result;
}

// ─── Built-in kinds ─────────────────────────────────────────────────────────

MoveAction::MoveAction(State start, float duration, Vec2 destination)
    : Action(std::string(kind_name(ActionKind::Move)), std::move(start), duration),
      dest_(destination)
{
}

State MoveAction::evaluate(float elapsed) const
{
    State s    = start_state();
    s.position = lerp(start_state().position, dest_, fraction(elapsed));
    return s;
}

RotateAction::RotateAction(State start, float duration, float destination)
    : Action(std::string(kind_name(ActionKind::Rotate)), std::move(start), duration),
      dest_(destination)
{
}

State RotateAction::evaluate(float elapsed) const
{
    State s = start_state();
    s.angle = lerp(start_state().angle, dest_, fraction(elapsed));
    return s;
}

ColorAction::ColorAction(State start, float duration, Color destination)
    : Action(std::string(kind_name(ActionKind::Color)), std::move(start), duration),
      dest_(destination)
{
}

State ColorAction::evaluate(float elapsed) const
{
    State s = start_state();
    s.color = lerp(start_state().color, dest_, fraction(elapsed));
    return s;
}

StopAction::StopAction(State start, float duration)
    : Action(std::string(kind_name(ActionKind::Stop)), std::move(start), duration)
{
}

State StopAction::evaluate(float) const
{
    return start_state();
}

// ─── CustomAction ───────────────────────────────────────────────────────────

CustomAction::CustomAction(State start, float duration, std::string type, Fn fn, Destination destination)
    : Action(std::move(type), std::move(start), duration),
      fn_(std::move(fn)),
      dest_(std::move(destination))
{
}

State CustomAction::evaluate(float elapsed) const
{
    if (!fn_)
    {
        return start_state();
    }
    return fn_(start_state(), elapsed);
}

// ─── Factory ────────────────────────────────────────────────────────────────

namespace
{

template <typename T>
const T& expect_destination(ActionKind kind, const Destination& destination)
{
    if (!std::holds_alternative<T>(destination))
    {
        STAGEHAND_LOG_WARN("timeline", "destination does not match {} action", kind_name(kind));
        throw InvalidDestinationError("destination does not match " +
                                      std::string(kind_name(kind)) + " action");
    }
    return std::get<T>(destination);
}

}  // anonymous namespace

std::unique_ptr<Action> make_action(ActionKind         kind,
                                    State              start,
                                    float              duration,
                                    const Destination& destination)
{
    switch (kind)
    {
        case ActionKind::Move:
            return std::make_unique<MoveAction>(
                std::move(start), duration, expect_destination<Vec2>(kind, destination));
        case ActionKind::Rotate:
            return std::make_unique<RotateAction>(
                std::move(start), duration, expect_destination<float>(kind, destination));
        case ActionKind::Color:
            return std::make_unique<ColorAction>(
                std::move(start), duration, expect_destination<Color>(kind, destination));
        case ActionKind::Stop:
            expect_destination<std::monostate>(kind, destination);
            return std::make_unique<StopAction>(std::move(start), duration);
    }
    throw InvalidDestinationError("unknown action kind");
}

}  // namespace stagehand
