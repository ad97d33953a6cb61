#pragma once

#include <filesystem>
#include <string>
#include <tabswitch/tab_item.hpp>
#include <vector>

namespace tabswitch
{

// A path-backed document. Detail level 0 shows the file name; each further
// level prepends one more parent directory until the whole path is shown.
class Document : public TabItem
{
   public:
    explicit Document(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    std::string tab_label(size_t detail) const override;

    bool is_dirty() const override { return dirty_; }
    void set_dirty(bool dirty) { dirty_ = dirty; }

    // Highest detail level that still changes the label.
    size_t max_detail() const { return components_.empty() ? 0 : components_.size() - 1; }

   private:
    std::filesystem::path    path_;
    std::vector<std::string> components_;   // Root-to-leaf, root name excluded
    bool                     dirty_ = false;
};

}   // namespace tabswitch
