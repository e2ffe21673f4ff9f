#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace lintel {

class Project;

// Categories of artifacts a detector can look at.
enum class Scope : uint8_t {
    Manifest,
    ResourceFile,       // a single resource file, checked in isolation
    AllResourceFiles,   // cross-file checks over every resource file
    SourceFile,
    AllSourceFiles,
    ClassFile,
    ProguardFile,
};

inline constexpr std::array<Scope, 7> kAllScopes = {
    Scope::Manifest,   Scope::ResourceFile, Scope::AllResourceFiles,
    Scope::SourceFile, Scope::AllSourceFiles, Scope::ClassFile,
    Scope::ProguardFile,
};

std::string_view scopeName(Scope s);
std::optional<Scope> parseScope(std::string_view name);

class ScopeSet {
public:
    constexpr ScopeSet() = default;
    constexpr ScopeSet(std::initializer_list<Scope> scopes) {
        for (Scope s : scopes)
            bits_ |= bit(s);
    }

    static constexpr ScopeSet all() {
        ScopeSet set;
        set.bits_ = (1u << kAllScopes.size()) - 1;
        return set;
    }

    static constexpr ScopeSet unite(ScopeSet a, ScopeSet b) {
        ScopeSet set;
        set.bits_ = a.bits_ | b.bits_;
        return set;
    }

    static constexpr ScopeSet intersect(ScopeSet a, ScopeSet b) {
        ScopeSet set;
        set.bits_ = a.bits_ & b.bits_;
        return set;
    }

    constexpr bool contains(Scope s) const { return (bits_ & bit(s)) != 0; }
    constexpr bool containsAll(ScopeSet subset) const {
        return (bits_ & subset.bits_) == subset.bits_;
    }
    constexpr bool empty() const { return bits_ == 0; }

    constexpr void insert(Scope s) { bits_ |= bit(s); }

    unsigned size() const;

    // True when the set describes a check of one file rather than a whole
    // project; library projects are not visited in that mode.
    bool isSingleFile() const;

    constexpr ScopeSet operator|(ScopeSet other) const { return unite(*this, other); }
    constexpr ScopeSet operator&(ScopeSet other) const { return intersect(*this, other); }
    constexpr bool operator==(const ScopeSet &other) const = default;

private:
    static constexpr uint8_t bit(Scope s) {
        return static_cast<uint8_t>(1u << static_cast<unsigned>(s));
    }

    uint8_t bits_ = 0;
};

namespace scopes {
inline constexpr ScopeSet kResourceFile{Scope::ResourceFile};
inline constexpr ScopeSet kAllResources{Scope::AllResourceFiles};
inline constexpr ScopeSet kSourceFile{Scope::SourceFile};
inline constexpr ScopeSet kAllSources{Scope::AllSourceFiles};
inline constexpr ScopeSet kClassFiles{Scope::ClassFile};
inline constexpr ScopeSet kManifest{Scope::Manifest};
inline constexpr ScopeSet kProguardFile{Scope::ProguardFile};
inline constexpr ScopeSet kSourceAndClassFiles{Scope::SourceFile, Scope::ClassFile};
} // namespace scopes

// Derives the scope of a run from what the user pointed at: a whole
// project means everything, otherwise each file of each project's subset
// contributes the category its name implies.
ScopeSet inferScope(llvm::ArrayRef<Project *> projects);

// Parses a comma separated list of scope names; std::nullopt when any
// name is unknown.
std::optional<ScopeSet> parseScopeList(llvm::StringRef list);

} // namespace lintel
