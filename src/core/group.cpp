#include <algorithm>
#include <stagehand/group.hpp>
#include <stagehand/logger.hpp>
#include <stdexcept>

namespace stagehand
{

ActorGroup::ActorGroup() : actors_(std::make_shared<Storage>()) {}

void ActorGroup::add(Actor& actor)
{
    actors_->push_back(&actor);
}

void ActorGroup::add(std::span<Actor* const> actors)
{
    if (std::find(actors.begin(), actors.end(), nullptr) != actors.end())
    {
        STAGEHAND_LOG_WARN("scene", "rejected null actor in group add of {} actors", actors.size());
        throw std::invalid_argument("ActorGroup::add: null actor");
    }
    actors_->insert(actors_->end(), actors.begin(), actors.end());
}

bool ActorGroup::contains(const Actor& actor) const
{
    return std::find(actors_->begin(), actors_->end(), &actor) != actors_->end();
}

}  // namespace stagehand
