#include "log.hpp"

#include <iostream>
#include <mutex>

namespace toolbridge
{
namespace internal
{

namespace
{
std::mutex& cerr_mutex()
{
    static std::mutex mutex;
    return mutex;
}
} // namespace

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;

    if (callback_.has_value())
    {
        try
        {
            (*callback_)(level, message);
            return;
        }
        catch (const std::exception& e)
        {
            // Fall through to stderr so the message is not lost
            std::lock_guard<std::mutex> lock(cerr_mutex());
            std::cerr << "[toolbridge] ERROR: log callback threw: " << e.what() << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(cerr_mutex());
    std::cerr << "[toolbridge] " << to_string(level) << ": " << message << std::endl;
}

} // namespace internal
} // namespace toolbridge
