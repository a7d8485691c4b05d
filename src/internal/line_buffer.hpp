#ifndef TOOLBRIDGE_INTERNAL_LINE_BUFFER_HPP
#define TOOLBRIDGE_INTERNAL_LINE_BUFFER_HPP

#include <optional>
#include <string>

namespace toolbridge
{
namespace internal
{

// Accumulates raw bytes from a pipe and hands them back one line at a time.
class LineBuffer
{
  public:
    explicit LineBuffer(size_t max_line_size = 1024 * 1024);

    // Append data read from the stream.
    // Throws ProtocolError(MalformedResponse) if a single line outgrows max_line_size.
    void add_data(const char* data, size_t size);
    void add_data(const std::string& data)
    {
        add_data(data.data(), data.size());
    }

    // Next complete line without its terminator ("\n" or "\r\n")
    std::optional<std::string> extract_line();

    // Remaining bytes of an unterminated final line, used once the stream ended
    std::optional<std::string> take_remainder();

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    // Clear buffer
    void clear_buffer()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
    size_t max_line_size_;
};

} // namespace internal
} // namespace toolbridge

#endif // TOOLBRIDGE_INTERNAL_LINE_BUFFER_HPP
