#pragma once

#include <stagehand/action.hpp>
#include <stagehand/actor.hpp>
#include <stagehand/color.hpp>
#include <stagehand/config.hpp>
#include <stagehand/error.hpp>
#include <stagehand/frame.hpp>
#include <stagehand/frame_clock.hpp>
#include <stagehand/fwd.hpp>
#include <stagehand/group.hpp>
#include <stagehand/logger.hpp>
#include <stagehand/render_sink.hpp>
#include <stagehand/scene.hpp>
#include <stagehand/state.hpp>
#include <stagehand/timeline.hpp>
