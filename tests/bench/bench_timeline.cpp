#include <benchmark/benchmark.h>
#include <memory>
#include <vector>

#include <stagehand/actor.hpp>
#include <stagehand/scene.hpp>

using namespace stagehand;

// --- Helpers ---

static void fill(Actor& actor, int actions)
{
    for (int i = 0; i < actions; ++i)
    {
        switch (i % 3)
        {
            case 0:
                actor.act(ActionKind::Move, 0.5f, Vec2{static_cast<float>(i), 0.0f});
                break;
            case 1:
                actor.act(ActionKind::Rotate, 0.25f, static_cast<float>(i));
                break;
            default:
                actor.act(ActionKind::Color, 0.75f, colors::red);
                break;
        }
    }
}

// --- Timeline queries ---

static void BM_StateAt(benchmark::State& state)
{
    Actor actor;
    fill(actor, static_cast<int>(state.range(0)));
    const float end = actor.actions().end_time();

    float t = 0.0f;
    for (auto _ : state)
    {
        auto s = actor.state_at(t);
        benchmark::DoNotOptimize(s);
        t += 0.37f;
        if (t >= end)
            t = 0.0f;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_StateAt)->Arg(10)->Arg(1'000)->Arg(100'000);

static void BM_Append(benchmark::State& state)
{
    for (auto _ : state)
    {
        Actor actor;
        fill(actor, static_cast<int>(state.range(0)));
        benchmark::DoNotOptimize(actor.actions().end_time());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Append)->Arg(100)->Arg(10'000);

// --- Scene ---

static void BM_SceneAdvance(benchmark::State& state)
{
    const auto                          n = static_cast<size_t>(state.range(0));
    std::vector<std::unique_ptr<Actor>> actors;
    SceneConfig                         config;
    config.fixed_timestep = 1.0f / 60.0f;
    Scene scene(config);

    for (size_t i = 0; i < n; ++i)
    {
        actors.push_back(std::make_unique<Actor>());
        fill(*actors.back(), 32);
        scene.add_actors(*actors.back());
    }

    for (auto _ : state)
    {
        scene.update();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SceneAdvance)->Arg(100)->Arg(1'000);

static void BM_Sync(benchmark::State& state)
{
    const auto n = static_cast<size_t>(state.range(0));
    for (auto _ : state)
    {
        state.PauseTiming();
        std::vector<std::unique_ptr<Actor>> actors;
        Scene                               scene(1, 1);
        for (size_t i = 0; i < n; ++i)
        {
            actors.push_back(std::make_unique<Actor>());
            fill(*actors.back(), static_cast<int>(i % 16));
            scene.add_actors(*actors.back());
        }
        state.ResumeTiming();

        scene.sync();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Sync)->Arg(100)->Arg(1'000);
