#ifndef LINE_SOURCE_HPP
#define LINE_SOURCE_HPP

#include <optional>
#include <string>

/**
 * @brief Cancellable blocking iterator over text lines
 *
 * next_line() blocks until a complete line is available and returns it
 * without its terminator. It returns nothing once the source has ended or
 * cancel() was called; after that the source is not restartable.
 */
class LineSource {
public:
    virtual ~LineSource() = default;

    virtual std::optional<std::string> next_line() = 0;

    // Safe to call from any thread; wakes a blocked next_line()
    virtual void cancel() = 0;
};

#endif // LINE_SOURCE_HPP
