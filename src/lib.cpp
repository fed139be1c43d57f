#include "schemaver/lib.hpp"
#include <sstream>

namespace schemaver {

// Formats the message with the file and line number of the call site.
std::string format_message(const char* file, int line, const char* msg, ...) {
    va_list args;
    va_start(args, msg);

    // Two-pass approach: the first call with a null buffer returns the number
    // of characters that would have been written.
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, msg, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << buffer.data();
    return ss.str();
}

} // namespace schemaver
