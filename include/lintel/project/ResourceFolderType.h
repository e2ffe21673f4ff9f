#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace lintel {

enum class ResourceFolderType : uint8_t {
    Anim,
    Animator,
    Color,
    Drawable,
    Interpolator,
    Layout,
    Menu,
    Mipmap,
    Raw,
    Values,
    Xml,
};

std::string_view resourceFolderName(ResourceFolderType type);

// Classifies a resource folder by its name without configuration
// qualifiers, so "values-fr-rCA" is Values and "layout-land" is Layout.
std::optional<ResourceFolderType> getFolderType(llvm::StringRef folderName);

} // namespace lintel
