#pragma once

#include <llvm/ADT/StringRef.h>

namespace lintel {

inline constexpr llvm::StringLiteral kManifestFile("AndroidManifest.xml");
inline constexpr llvm::StringLiteral kResFolder("res");
inline constexpr llvm::StringLiteral kSrcFolder("src");
inline constexpr llvm::StringLiteral kLibsFolder("libs");
inline constexpr llvm::StringLiteral kBinClassesFolder("bin/classes");
inline constexpr llvm::StringLiteral kProguardConfig("proguard.cfg");
inline constexpr llvm::StringLiteral kProjectProperties("project.properties");
inline constexpr llvm::StringLiteral kConfigFile("lintel.yaml");

inline constexpr llvm::StringLiteral kDotXml(".xml");
inline constexpr llvm::StringLiteral kDotJava(".java");
inline constexpr llvm::StringLiteral kDotClass(".class");
inline constexpr llvm::StringLiteral kDotJar(".jar");

// Suppression annotations. The bytecode form is matched against the
// annotation's binary descriptor, e.g. "Landroid/annotation/SuppressLint;".
inline constexpr llvm::StringLiteral kSuppressLint("SuppressLint");
inline constexpr llvm::StringLiteral kSuppressLintVmSig("/SuppressLint;");
inline constexpr llvm::StringLiteral kSuppressWarnings("SuppressWarnings");
inline constexpr llvm::StringLiteral kSuppressAll("all");

inline constexpr llvm::StringLiteral kManifestPackageAttr("package");
inline constexpr llvm::StringLiteral kUsesSdkTag("uses-sdk");
inline constexpr llvm::StringLiteral kMinSdkVersionAttr("android:minSdkVersion");

inline constexpr llvm::StringLiteral kLibraryProperty("android.library");
inline constexpr llvm::StringLiteral kLibraryReferencePrefix("android.library.reference.");

inline constexpr int kMaxPhases = 3;

} // namespace lintel
