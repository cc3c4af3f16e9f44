#pragma once

#include <stagehand/action.hpp>
#include <stagehand/state.hpp>
#include <stagehand/timeline.hpp>
#include <string>
#include <utility>

namespace stagehand
{

// Caller-managed bounding box. The top-left corner is the actor's position.
struct Rect
{
    float x      = 0.0f;
    float y      = 0.0f;
    float width  = 0.0f;
    float height = 0.0f;

    Vec2 top_left() const { return {x, y}; }

    friend constexpr bool operator==(const Rect&, const Rect&) = default;
};

// A visual entity: live state (what a renderer draws) plus the timeline
// that drives it. Groups and scenes refer to actors by address, so actors
// are neither copyable nor movable.
class Actor
{
   public:
    Actor() = default;
    explicit Actor(std::string name) : name_(std::move(name)) {}

    Actor(const Actor&)            = delete;
    Actor& operator=(const Actor&) = delete;

    const std::string& name() const { return name_; }
    void               set_name(std::string name) { name_ = std::move(name); }

    // ─── Live state ─────────────────────────────────────────────────────
    // Writes take effect immediately. While no action is queued they also
    // become the starting point of the next act().
    const Vec2&  position() const { return state_.position; }
    const Color& color() const { return state_.color; }
    float        angle() const { return state_.angle; }
    const State& state() const { return state_; }

    void set_position(Vec2 position);
    void set_color(Color color);
    void set_angle(float angle);

    float width() const { return width_; }
    float height() const { return height_; }
    Rect  rect() const { return Rect{state_.position.x, state_.position.y, width_, height_}; }
    void  set_size(float width, float height);
    void  set_rect(const Rect& rect);

    // ─── Timeline ───────────────────────────────────────────────────────
    const Action& act(ActionKind kind, float duration, const Destination& destination = std::monostate{});

    template <typename T, typename... Args>
    T& act(float duration, Args&&... args)
    {
        return timeline_.append<T>(duration, std::forward<Args>(args)...);
    }

    // Sets the actor's clock to the absolute time `t` and copies the
    // timeline's state at `t` into the live state. Order independent.
    void update(float t);

    float time() const { return time_; }

    State         state_at(float t) const { return timeline_.state_at(t); }
    const Action& action_at(float t) const { return timeline_.action_at(t); }

    const Timeline& actions() const { return timeline_; }
    Timeline&       actions() { return timeline_; }

   private:
    void rebase_timeline();

    std::string name_;
    State       state_;
    float       width_  = 0.0f;
    float       height_ = 0.0f;
    float       time_   = 0.0f;
    Timeline    timeline_;
};

}  // namespace stagehand
