#pragma once

#include <string>

namespace mcpmux
{

// Random RFC 4122 version 4 UUID, lowercase.
std::string random_uuid();

}   // namespace mcpmux
