#pragma once

#include <functional>
#include <memory>
#include <stagehand/state.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace stagehand
{

enum class ActionKind
{
    Move,
    Rotate,
    Color,
    Stop,
};

std::string_view kind_name(ActionKind kind);

// Target value of an action: a position for Move, an angle for Rotate,
// a color for Color and nothing for Stop.
using Destination = std::variant<std::monostate, Vec2, float, Color>;

// A timed unit of behavior. An action is built once, when it is appended
// to a Timeline, from the timeline's state at that point (`start_state`).
// Its output is a pure function of the elapsed time since its own start.
//
// Custom actions derive from Action, implement evaluate(), and provide a
// constructor taking (State start, float duration, Args...) so that
// Timeline::append<T>() can build them.
class Action
{
   public:
    virtual ~Action() = default;

    Action(const Action&)            = delete;
    Action& operator=(const Action&) = delete;

    const std::string& type() const { return type_; }
    float              duration() const { return duration_; }
    const State&       start_state() const { return start_state_; }

    virtual Destination destination() const { return std::monostate{}; }

    // State `elapsed` seconds after the action started. `elapsed` is
    // clamped to [0, duration]. Throws UnknownKeyError if the result
    // dropped a custom key of start_state().
    State state_after(float elapsed) const;

    // Linear progress in [0, 1]. A zero-length action is always complete.
    float fraction(float elapsed) const;

   protected:
    Action(std::string type, State start, float duration);

    // Called with elapsed already clamped.
    virtual State evaluate(float elapsed) const = 0;

    void set_start_state(State start) { start_state_ = std::move(start); }

   private:
    std::string type_;
    State       start_state_;
    float       duration_ = 0.0f;
};

class MoveAction : public Action
{
   public:
    MoveAction(State start, float duration, Vec2 destination);

    Destination destination() const override { return dest_; }

   protected:
    State evaluate(float elapsed) const override;

   private:
    Vec2 dest_;
};

class RotateAction : public Action
{
   public:
    RotateAction(State start, float duration, float destination);

    Destination destination() const override { return dest_; }

   protected:
    State evaluate(float elapsed) const override;

   private:
    float dest_;
};

class ColorAction : public Action
{
   public:
    ColorAction(State start, float duration, Color destination);

    Destination destination() const override { return dest_; }

   protected:
    State evaluate(float elapsed) const override;

   private:
    Color dest_;
};

// Holds start_state for its whole duration. Also used as the implicit
// terminal action past the end of a timeline (with an infinite duration).
class StopAction : public Action
{
   public:
    StopAction(State start, float duration);

   protected:
    State evaluate(float elapsed) const override;

   private:
    friend class Timeline;

    // Terminal only: updated in place as actions are queued.
    void hold(State state) { set_start_state(std::move(state)); }
};

// Custom behavior given as a callable instead of a subclass.
// `fn(start_state, elapsed)` must return a full snapshot, typically
// start_state.with(...) for the keys it computes.
class CustomAction : public Action
{
   public:
    using Fn = std::function<State(const State& start, float elapsed)>;

    CustomAction(State       start,
                 float       duration,
                 std::string type,
                 Fn          fn,
                 Destination destination = std::monostate{});

    Destination destination() const override { return dest_; }

   protected:
    State evaluate(float elapsed) const override;

   private:
    Fn          fn_;
    Destination dest_;
};

// Builds a built-in action. Throws InvalidDestinationError if the
// destination alternative does not fit the kind.
std::unique_ptr<Action> make_action(ActionKind         kind,
                                    State              start,
                                    float              duration,
                                    const Destination& destination);

}  // namespace stagehand
