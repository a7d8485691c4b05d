#ifndef TOOLBRIDGE_VERSION_HPP
#define TOOLBRIDGE_VERSION_HPP

#include <string>

namespace toolbridge
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 1;

std::string version_string();

} // namespace toolbridge

#endif // TOOLBRIDGE_VERSION_HPP
