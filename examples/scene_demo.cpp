// Three actors queued independently, synchronized, then given a shared
// finale. Frames are written to the log by TraceRenderSink.

#include <cstdlib>
#include <stagehand/stagehand.hpp>

using namespace stagehand;

int main()
{
    SceneConfig config = SceneConfig::from_env();
    config.width       = 600;
    config.height      = 400;
    if (config.fixed_timestep <= 0.0f)
    {
        config.fixed_timestep = 1.0f / 30.0f;
    }

    Logger::instance().add_sink(sinks::console_sink());
    if (const char* path = std::getenv("STAGEHAND_LOG_FILE"))
    {
        Logger::instance().add_sink(sinks::file_sink(path));
    }

    Scene scene(config);

    Actor box("box");
    box.set_rect({20.0f, 20.0f, 40.0f, 40.0f});
    box.act(ActionKind::Move, 1.0f, Vec2{300.0f, 20.0f});
    box.act(ActionKind::Rotate, 0.5f, 45.0f);

    Actor lamp("lamp");
    lamp.set_position({100.0f, 200.0f});
    lamp.act(ActionKind::Color, 2.0f, colors::red);

    Actor idle("idle");
    idle.set_position({500.0f, 350.0f});

    scene.add_actors({&box, &lamp});
    scene.add_actors(idle, "background");

    // Pad everyone to the slowest actor, then queue a finale for all three.
    scene.sync();
    box.act(ActionKind::Move, 1.0f, Vec2{300.0f, 300.0f});
    lamp.act(ActionKind::Color, 1.0f, colors::blue);
    idle.act(ActionKind::Rotate, 1.0f, 360.0f);

    TraceRenderSink sink;
    auto            frames = scene.run(&sink);

    STAGEHAND_LOG_INFO("demo",
                       "{} frames, {}s; box at ({}, {}), lamp blue={}",
                       frames,
                       scene.time(),
                       box.position().x,
                       box.position().y,
                       lamp.color().b);
    return 0;
}
