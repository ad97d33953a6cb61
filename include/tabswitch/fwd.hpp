#pragma once

#include <cstdint>
#include <memory>

namespace tabswitch
{

// Stable pane identifier. Monotonic, never reused within a Workspace.
using PaneId = uint64_t;

// Sentinel value for "no pane".
inline constexpr PaneId INVALID_PANE_ID = 0;

class TabItem;
using TabItemHandle = std::shared_ptr<TabItem>;

class Pane;
class PaneLookup;
class FuzzyMatcher;

class Document;
class ItemPane;
class Workspace;

struct TabMatch;
struct OriginalItem;
struct TabRow;
class TabSnapshot;
class TabMatchList;
class TabSwitcher;
class TabSwitcherModal;
struct SwitcherConfig;

class CommandRegistry;
class ShortcutManager;
class CommandQueue;

}   // namespace tabswitch
