#include "lintel/project/ResourceFolderType.h"

#include <array>
#include <utility>

namespace lintel {

namespace {

constexpr std::array<std::pair<ResourceFolderType, std::string_view>, 11> kFolderNames = {{
    {ResourceFolderType::Anim,         "anim"},
    {ResourceFolderType::Animator,     "animator"},
    {ResourceFolderType::Color,        "color"},
    {ResourceFolderType::Drawable,     "drawable"},
    {ResourceFolderType::Interpolator, "interpolator"},
    {ResourceFolderType::Layout,       "layout"},
    {ResourceFolderType::Menu,         "menu"},
    {ResourceFolderType::Mipmap,       "mipmap"},
    {ResourceFolderType::Raw,          "raw"},
    {ResourceFolderType::Values,       "values"},
    {ResourceFolderType::Xml,          "xml"},
}};

} // anonymous namespace

std::string_view resourceFolderName(ResourceFolderType type) {
    for (const auto &[t, name] : kFolderNames) {
        if (t == type)
            return name;
    }
    return "";
}

std::optional<ResourceFolderType> getFolderType(llvm::StringRef folderName) {
    llvm::StringRef base = folderName.split('-').first;
    for (const auto &[type, name] : kFolderNames) {
        if (base == llvm::StringRef(name))
            return type;
    }
    return std::nullopt;
}

} // namespace lintel
