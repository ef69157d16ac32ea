#pragma once

namespace combopanel
{

struct Color;
struct Rect;
struct Theme;
struct FontSpec;
struct ColorSource;
struct FontSource;
struct Gradient;

class ThemedConfig;
class LayoutConfig;
class AnimatedConfig;
class FrameConfig;
struct LayoutSettings;
struct AnimationSettings;
struct ContentItemConfig;

class DrawSurface;
class Path;
class SvgSurface;
class ImGuiSurface;

class FrameRenderer;
class SkinRegistry;
class ContentItemRenderer;
class PanelComposer;
class FrameScheduler;

struct RetroTerminalConfig;
struct CyberpunkConfig;
class RetroTerminalRenderer;
class CyberpunkRenderer;

class Logger;

}   // namespace combopanel
