#include <algorithm>
#include <cmath>
#include <stagehand/actor.hpp>
#include <stagehand/error.hpp>
#include <stagehand/logger.hpp>
#include <stagehand/render_sink.hpp>
#include <stagehand/scene.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace stagehand
{

Scene::Scene(const SceneConfig& config) : config_(config), clock_(config.framerate, config.clock_mode)
{
    clock_.set_max_tick(config_.max_tick);
    if (config_.fixed_timestep > 0.0f)
    {
        clock_.set_fixed_timestep(config_.fixed_timestep);
    }
    groups_.emplace(DEFAULT_GROUP, ActorGroup{});
    Logger::instance().set_level(config_.log_level);

    STAGEHAND_LOG_DEBUG("scene",
                        "created {}x{} scene at {} fps",
                        config_.width,
                        config_.height,
                        clock_.framerate());
}

Scene::Scene(int width, int height) : Scene(SceneConfig{.width = width, .height = height}) {}

void Scene::set_framerate(float fps)
{
    clock_.set_framerate(fps);
    config_.framerate = clock_.framerate();
}

// ─── Groups ─────────────────────────────────────────────────────────────────

ActorGroup& Scene::ensure_group(const std::string& name)
{
    auto it = groups_.find(name);
    if (it == groups_.end())
    {
        STAGEHAND_LOG_DEBUG("scene", "new group '{}'", name);
        it = groups_.emplace(name, ActorGroup{}).first;
    }
    return it->second;
}

void Scene::add_actors(Actor& actor, const std::string& groupname)
{
    ensure_group(groupname).add(actor);
}

void Scene::add_actors(const std::vector<Actor*>& actors, const std::string& groupname)
{
    // Validate before creating the group so a rejected call changes nothing.
    if (std::find(actors.begin(), actors.end(), nullptr) != actors.end())
    {
        STAGEHAND_LOG_WARN("scene", "rejected null actor for group '{}'", groupname);
        throw std::invalid_argument("Scene::add_actors: null actor");
    }
    ensure_group(groupname).add(actors);
}

void Scene::add_actorgroup(const ActorGroup& group, const std::string& groupname)
{
    auto it = groups_.find(groupname);
    if (it != groups_.end() && !it->second.shares_storage_with(group))
    {
        STAGEHAND_LOG_DEBUG("scene", "group '{}' replaced ({} actors dropped)", groupname, it->second.size());
    }
    groups_.insert_or_assign(groupname, group);
}

bool Scene::has_group(const std::string& name) const
{
    return groups_.find(name) != groups_.end();
}

ActorGroup Scene::group(const std::string& name) const
{
    auto it = groups_.find(name);
    if (it == groups_.end())
    {
        throw std::out_of_range("no actor group named '" + name + "'");
    }
    return it->second;
}

std::vector<Actor*> Scene::distinct_actors() const
{
    std::vector<Actor*>               out;
    std::unordered_set<const Actor*> seen;
    for (const auto& [name, group] : groups_)
    {
        for (Actor* actor : group)
        {
            if (seen.insert(actor).second)
            {
                out.push_back(actor);
            }
        }
    }
    return out;
}

size_t Scene::actor_count() const
{
    return distinct_actors().size();
}

// ─── Clock ──────────────────────────────────────────────────────────────────

float Scene::update()
{
    float dt = clock_.tick();
    advance(dt);
    return dt;
}

void Scene::advance(float dt)
{
    if (!std::isfinite(dt) || dt < 0.0f)
    {
        STAGEHAND_LOG_WARN("scene", "rejected clock advance of {}s", dt);
        throw InvalidDurationError("scene time step must be finite and >= 0, got " + std::to_string(dt));
    }

    time_ += dt;
    for (Actor* actor : distinct_actors())
    {
        actor->update(time_);
    }
    STAGEHAND_LOG_TRACE("scene", "time {} (+{})", time_, dt);
}

// ─── Synchronization ────────────────────────────────────────────────────────

float Scene::end_time() const
{
    float max_end = 0.0f;
    for (const Actor* actor : distinct_actors())
    {
        max_end = std::max(max_end, actor->actions().end_time());
    }
    return max_end;
}

void Scene::sync()
{
    auto  actors  = distinct_actors();
    float max_end = 0.0f;
    for (const Actor* actor : actors)
    {
        max_end = std::max(max_end, actor->actions().end_time());
    }

    size_t padded = 0;
    for (Actor* actor : actors)
    {
        if (actor->actions().end_time() < max_end)
        {
            actor->actions().pad_to(max_end);
            ++padded;
        }
    }

    STAGEHAND_LOG_DEBUG("scene", "sync: padded {} of {} actors to {}s", padded, actors.size(), max_end);
}

// ─── Rendering ──────────────────────────────────────────────────────────────

void Scene::render(RenderSink& sink) const
{
    sink.begin_frame(clock_.current_frame());
    for (const Actor* actor : distinct_actors())
    {
        sink.draw(*actor);
    }
    sink.end_frame();
}

uint64_t Scene::run(RenderSink* sink, float until)
{
    if (!std::isfinite(until))
    {
        throw InvalidDurationError("Scene::run needs a finite end time");
    }

    STAGEHAND_LOG_INFO("scene", "running from {}s to {}s", time_, until);

    uint64_t frames = 0;
    while (time_ < until)
    {
        update();
        if (sink)
        {
            render(*sink);
        }
        ++frames;
    }
    return frames;
}

uint64_t Scene::run(RenderSink* sink)
{
    return run(sink, end_time());
}

}  // namespace stagehand
