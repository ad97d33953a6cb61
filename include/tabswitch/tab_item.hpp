#pragma once

#include <cstddef>
#include <string>
#include <tabswitch/fwd.hpp>

namespace tabswitch
{

// An open document as seen from a tab strip. The switcher never owns the
// document's lifecycle; it only holds a shared handle and compares by identity.
class TabItem
{
   public:
    virtual ~TabItem() = default;

    // Label shown for the tab at the given level of detail. Level 0 is the
    // shortest form. Past some level the label must stop changing.
    virtual std::string tab_label(size_t detail) const = 0;

    // Unsaved-changes indicator.
    virtual bool is_dirty() const { return false; }
};

}   // namespace tabswitch
