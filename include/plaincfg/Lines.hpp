/**
 * @file Lines.hpp
 * @brief Abstract line sources and sinks used by the reader and writer
 */

#ifndef PLAINCFG_LINES_HPP
#define PLAINCFG_LINES_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plaincfg {

/**
 * @brief Producer of text lines
 *
 * Each line keeps its terminator; a final unterminated line has none.
 */
class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * @brief Fetch the next line
     * @param line Receives the line, terminator included
     * @return false once the source is exhausted
     */
    virtual bool next(std::string& line) = 0;
};

/**
 * @brief Consumer of text, in order
 */
class LineSink {
public:
    virtual ~LineSink() = default;

    virtual void write(std::string_view text) = 0;
};

/**
 * @brief Lines held in memory
 */
class VectorLineSource : public LineSource {
public:
    explicit VectorLineSource(std::vector<std::string> lines)
        : lines_(std::move(lines)) {}

    /**
     * @brief Split text into lines, keeping each "\n"
     */
    static VectorLineSource from_text(std::string_view text);

    bool next(std::string& line) override;

private:
    std::vector<std::string> lines_;
    std::size_t pos_ = 0;
};

/**
 * @brief Lines read from a std::istream
 *
 * The stream must outlive the source.
 */
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& in) : in_(in) {}

    bool next(std::string& line) override;

private:
    std::istream& in_;
};

/**
 * @brief Accumulates everything written into a string
 */
class StringLineSink : public LineSink {
public:
    void write(std::string_view text) override { text_.append(text); }

    const std::string& str() const noexcept { return text_; }

private:
    std::string text_;
};

/**
 * @brief Writes to a std::ostream
 *
 * The stream must outlive the sink.
 */
class StreamLineSink : public LineSink {
public:
    explicit StreamLineSink(std::ostream& out) : out_(out) {}

    void write(std::string_view text) override;

private:
    std::ostream& out_;
};

} // namespace plaincfg

#endif // PLAINCFG_LINES_HPP
