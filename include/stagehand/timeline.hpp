#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stagehand/action.hpp>
#include <stagehand/state.hpp>
#include <type_traits>
#include <utility>
#include <vector>

namespace stagehand
{

// Append-only sequence of actions laid end to end. Action k starts at the
// sum of the durations of actions 0..k-1; the timeline ends at the sum of
// all durations. Queries never mutate, so the state at any time can be
// asked for in any order.
class Timeline
{
   public:
    // Result of resolve(): the action covering a time and how far into it
    // that time is. `index` is empty for the terminal stop past the end.
    struct Resolved
    {
        const Action&         action;
        float                 start         = 0.0f;
        float                 local_elapsed = 0.0f;
        std::optional<size_t> index;

        bool is_terminal() const { return !index.has_value(); }
    };

    // `origin` is the state reported while the timeline is empty and the
    // start state of the first appended action.
    explicit Timeline(State origin = {});

    Timeline(const Timeline&)            = delete;
    Timeline& operator=(const Timeline&) = delete;

    // ─── Building ───────────────────────────────────────────────────────
    // Appends a built-in action starting from final_state().
    // Throws InvalidDurationError (negative, NaN or infinite duration) or
    // InvalidDestinationError; the timeline is unchanged on failure.
    const Action& append(ActionKind         kind,
                         float              duration,
                         const Destination& destination = std::monostate{});

    // Appends a custom action, constructed as T(final_state(), duration, args...).
    template <typename T, typename... Args>
    T& append(float duration, Args&&... args);

    // Appends a stop so that end_time() becomes exactly `end_time`.
    // No-op if the timeline already lasts that long.
    void pad_to(float end_time);

    // Replaces the origin state. Only possible while empty; returns false
    // (and changes nothing) once actions have been queued.
    bool rebase(const State& origin);

    // ─── Queries ────────────────────────────────────────────────────────
    // The action whose interval [start, start + duration) contains t.
    // At a boundary the action beginning there wins; zero-length actions
    // are never returned. For t >= end_time() a terminal stop holding
    // final_state() is returned; it is the same object for the lifetime of
    // the timeline and always holds the current final_state().
    // Throws OutOfRangeQueryError for t < 0.
    Resolved resolve(float t) const;

    State         state_at(float t) const;
    const Action& action_at(float t) const { return resolve(t).action; }

    float end_time() const { return end_time_; }
    float start_of(size_t index) const { return starts_.at(index); }

    // State at end_time(): the last action's end state, or the origin.
    const State& final_state() const { return terminal_->start_state(); }
    const State& origin() const { return origin_; }

    size_t        size() const { return actions_.size(); }
    bool          empty() const { return actions_.empty(); }
    const Action& operator[](size_t index) const { return *actions_[index]; }
    const Action& at(size_t index) const { return *actions_.at(index); }

    const std::vector<std::unique_ptr<Action>>& actions() const { return actions_; }

   private:
    static void check_duration(float duration);
    void        push(std::unique_ptr<Action> action, std::optional<float> exact_end = std::nullopt);

    State                                origin_;
    std::vector<std::unique_ptr<Action>> actions_;
    std::vector<float>                   starts_;
    float                                end_time_ = 0.0f;
    std::unique_ptr<StopAction>          terminal_;
};

template <typename T, typename... Args>
T& Timeline::append(float duration, Args&&... args)
{
    static_assert(std::is_base_of_v<Action, T>, "Timeline::append<T>: T must derive from Action");

    check_duration(duration);
    auto action = std::make_unique<T>(final_state(), duration, std::forward<Args>(args)...);
    T&   ref    = *action;
    push(std::move(action));
    return ref;
}

}  // namespace stagehand
