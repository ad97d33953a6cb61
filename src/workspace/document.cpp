#include "document.hpp"

#include <algorithm>

namespace tabswitch
{

Document::Document(std::filesystem::path path) : path_(std::move(path))
{
    for (const auto& part : path_.relative_path())
    {
        std::string s = part.string();
        if (!s.empty())
            components_.push_back(std::move(s));
    }
}

std::string Document::tab_label(size_t detail) const
{
    if (components_.empty())
        return "untitled";

    size_t shown = std::min(detail + 1, components_.size());
    size_t first = components_.size() - shown;

    std::string label;
    for (size_t i = first; i < components_.size(); ++i)
    {
        if (!label.empty())
            label += '/';
        label += components_[i];
    }
    return label;
}

}   // namespace tabswitch
