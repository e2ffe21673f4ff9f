#pragma once

namespace lintel {

inline constexpr const char *kToolVersion = "0.1.0";

} // namespace lintel
