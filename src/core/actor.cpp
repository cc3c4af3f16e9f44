#include <stagehand/actor.hpp>
#include <stagehand/logger.hpp>

namespace stagehand
{

void Actor::rebase_timeline()
{
    if (!timeline_.rebase(state_))
    {
        STAGEHAND_LOG_TRACE("actor",
                            "'{}': live state changed with {} queued actions, timeline keeps its origin",
                            name_,
                            timeline_.size());
    }
}

void Actor::set_position(Vec2 position)
{
    state_.position = position;
    rebase_timeline();
}

void Actor::set_color(Color color)
{
    state_.color = color;
    rebase_timeline();
}

void Actor::set_angle(float angle)
{
    state_.angle = angle;
    rebase_timeline();
}

void Actor::set_size(float width, float height)
{
    width_  = width;
    height_ = height;
}

void Actor::set_rect(const Rect& rect)
{
    set_size(rect.width, rect.height);
    set_position(rect.top_left());
}

const Action& Actor::act(ActionKind kind, float duration, const Destination& destination)
{
    return timeline_.append(kind, duration, destination);
}

void Actor::update(float t)
{
    State next = timeline_.state_at(t);
    time_      = t;
    state_     = std::move(next);
}

}  // namespace stagehand
