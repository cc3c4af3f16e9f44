// Custom actions: one as a subclass, one as a callable. Both add their own
// keys to the snapshot and the built-in actions that follow carry them on.

#include <cmath>
#include <stagehand/stagehand.hpp>

using namespace stagehand;

// Bobs the actor up and down around its start position.
class BobAction : public Action
{
   public:
    BobAction(State start, float duration, float amplitude)
        : Action("Bob", std::move(start), duration), amplitude_(amplitude)
    {
    }

    Destination destination() const override { return amplitude_; }

   protected:
    State evaluate(float elapsed) const override
    {
        State s = start_state();
        s.position.y += amplitude_ * std::sin(elapsed * 6.2831853f);
        return s.with("bob_phase", elapsed);
    }

   private:
    float amplitude_;
};

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    Actor actor("bobber");
    actor.set_position({50.0f, 50.0f});

    actor.act<BobAction>(2.0f, 10.0f);
    actor.act<CustomAction>(1.0f,
                            "Fade",
                            [](const State& start, float elapsed)
                            {
                                return start.with("opacity", 1.0f - elapsed);
                            });
    actor.act(ActionKind::Move, 1.0f, Vec2{150.0f, 50.0f});

    for (float t = 0.0f; t <= actor.actions().end_time() + 0.5f; t += 0.5f)
    {
        State s = actor.state_at(t);
        STAGEHAND_LOG_INFO("demo",
                           "t={} {} pos=({}, {}) opacity={}",
                           t,
                           actor.action_at(t).type(),
                           s.position.x,
                           s.position.y,
                           s.has("opacity") ? s.get<float>("opacity") : 1.0f);
    }
    return 0;
}
