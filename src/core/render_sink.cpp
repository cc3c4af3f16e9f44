#include <stagehand/actor.hpp>
#include <stagehand/logger.hpp>
#include <stagehand/render_sink.hpp>

namespace stagehand
{

void TraceRenderSink::begin_frame(const Frame& frame)
{
    frame_number_ = frame.number;
}

void TraceRenderSink::draw(const Actor& actor)
{
    const auto& s = actor.state();
    STAGEHAND_LOG_DEBUG("render",
                        "frame {} '{}' pos=({}, {}) color=({}, {}, {}) angle={}",
                        frame_number_,
                        actor.name(),
                        s.position.x,
                        s.position.y,
                        s.color.r,
                        s.color.g,
                        s.color.b,
                        s.angle);
}

}  // namespace stagehand
