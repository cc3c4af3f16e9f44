#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace stagehand
{

class Actor;

// Handle to a shared, ordered collection of actors. Copies of a handle
// refer to the same collection: adding through one is visible through all
// of them (this is how a group registered in a Scene stays in step with
// the caller's copy). The group does not own its actors.
class ActorGroup
{
   public:
    using Storage        = std::vector<Actor*>;
    using const_iterator = Storage::const_iterator;

    ActorGroup();

    void add(Actor& actor);
    void add(std::span<Actor* const> actors);

    template <typename... More>
    void add(Actor& first, Actor& second, More&... more)
    {
        add(first);
        add(second, more...);
    }

    size_t size() const { return actors_->size(); }
    bool   empty() const { return actors_->empty(); }
    bool   contains(const Actor& actor) const;

    const_iterator begin() const { return actors_->cbegin(); }
    const_iterator end() const { return actors_->cend(); }

    Actor& operator[](size_t index) const { return *(*actors_)[index]; }

    bool shares_storage_with(const ActorGroup& other) const { return actors_ == other.actors_; }

   private:
    std::shared_ptr<Storage> actors_;
};

}  // namespace stagehand
