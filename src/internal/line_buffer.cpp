#include "line_buffer.hpp"

#include <toolbridge/errors.hpp>

namespace toolbridge
{
namespace internal
{

LineBuffer::LineBuffer(size_t max_line_size) : max_line_size_(max_line_size) {}

void LineBuffer::add_data(const char* data, size_t size)
{
    buffer_.append(data, size);

    // Only the unterminated tail counts against the limit
    size_t last_newline = buffer_.rfind('\n');
    size_t pending = last_newline == std::string::npos ? buffer_.size()
                                                       : buffer_.size() - last_newline - 1;
    if (pending > max_line_size_)
    {
        buffer_.clear();
        throw ProtocolError(ErrorKind::MalformedResponse,
                            "Line exceeded maximum size of " + std::to_string(max_line_size_) +
                                " bytes (was " + std::to_string(pending) + ")");
    }
}

std::optional<std::string> LineBuffer::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return line;
}

std::optional<std::string> LineBuffer::take_remainder()
{
    if (buffer_.empty())
        return std::nullopt;

    std::string line;
    line.swap(buffer_);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

} // namespace internal
} // namespace toolbridge
