#pragma once

#include <cstdint>
#include <stagehand/frame.hpp>

namespace stagehand
{

class Actor;

// Boundary to whatever draws actors. Scene::render() calls begin_frame(),
// then draw() once per managed actor, then end_frame(). Implementations
// read the actor's live position/color/angle and rect; the core never
// looks at pixels.
class RenderSink
{
   public:
    virtual ~RenderSink() = default;

    virtual void begin_frame(const Frame& /*frame*/) {}
    virtual void draw(const Actor& actor) = 0;
    virtual void end_frame() {}
};

// Writes every drawn actor's state to the logger at debug level.
class TraceRenderSink : public RenderSink
{
   public:
    void begin_frame(const Frame& frame) override;
    void draw(const Actor& actor) override;

   private:
    uint64_t frame_number_ = 0;
};

}  // namespace stagehand
