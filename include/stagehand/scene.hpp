#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stagehand/config.hpp>
#include <stagehand/frame_clock.hpp>
#include <stagehand/group.hpp>
#include <string>
#include <vector>

namespace stagehand
{

class Actor;
class RenderSink;

// Owns the global clock and the named actor groups. Every update() moves
// the clock forward and pushes the new absolute time into each actor.
class Scene
{
   public:
    static constexpr const char* DEFAULT_GROUP = "default";

    explicit Scene(const SceneConfig& config = {});
    Scene(int width, int height);

    Scene(const Scene&)            = delete;
    Scene& operator=(const Scene&) = delete;

    int                width() const { return config_.width; }
    int                height() const { return config_.height; }
    const SceneConfig& config() const { return config_; }

    float time() const { return time_; }

    void  set_framerate(float fps);
    float framerate() const { return clock_.framerate(); }

    FrameClock&       clock() { return clock_; }
    const FrameClock& clock() const { return clock_; }

    // ─── Groups ─────────────────────────────────────────────────────────
    // Adds to the named group, creating it if needed.
    void add_actors(Actor& actor, const std::string& groupname = DEFAULT_GROUP);
    void add_actors(const std::vector<Actor*>& actors, const std::string& groupname = DEFAULT_GROUP);

    // Registers `group` under `groupname` by reference: later additions
    // through either handle are seen by both. Replaces any group already
    // registered under that name.
    void add_actorgroup(const ActorGroup& group, const std::string& groupname);

    const std::map<std::string, ActorGroup>& groups() const { return groups_; }
    bool                                     has_group(const std::string& name) const;

    // Throws std::out_of_range for an unknown name.
    ActorGroup group(const std::string& name) const;

    // Number of distinct actors across all groups.
    size_t actor_count() const;

    // ─── Clock ──────────────────────────────────────────────────────────
    // Advances by one clock tick; returns the tick length.
    float update();

    // Advances by exactly `dt` seconds and updates every actor.
    // Throws InvalidDurationError for negative or non-finite dt.
    void advance(float dt);

    // ─── Synchronization ────────────────────────────────────────────────
    // Pads every timeline shorter than the longest one with a stop so all
    // managed actors end together. Idempotent.
    void sync();

    // Longest timeline among managed actors (0 with no actors).
    float end_time() const;

    // ─── Rendering ──────────────────────────────────────────────────────
    void render(RenderSink& sink) const;

    // Calls update() (and render() when a sink is given) until time()
    // reaches `until`. Returns the number of frames run.
    uint64_t run(RenderSink* sink, float until);

    // Runs until every timeline has finished.
    uint64_t run(RenderSink* sink = nullptr);

   private:
    ActorGroup& ensure_group(const std::string& name);

    // Each distinct actor once: groups in name order, then insertion order.
    std::vector<Actor*> distinct_actors() const;

    SceneConfig                       config_;
    FrameClock                        clock_;
    float                             time_ = 0.0f;
    std::map<std::string, ActorGroup> groups_;
};

}  // namespace stagehand
