#include <sstream>
#include <toolbridge/version.hpp>

namespace toolbridge
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace toolbridge
