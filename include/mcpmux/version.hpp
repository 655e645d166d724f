#pragma once

namespace mcpmux
{

inline constexpr const char* VERSION = "0.3.0";

}   // namespace mcpmux
