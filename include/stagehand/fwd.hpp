#pragma once

namespace stagehand
{

struct Vec2;
struct Color;
struct State;
struct Rect;
struct Frame;
struct SceneConfig;

class Action;
class MoveAction;
class RotateAction;
class ColorAction;
class StopAction;
class CustomAction;
class Timeline;
class Actor;
class ActorGroup;
class FrameClock;
class Scene;
class RenderSink;
class Logger;

}  // namespace stagehand
