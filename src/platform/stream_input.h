#ifndef TEXTEXPANDER_STREAM_INPUT_H
#define TEXTEXPANDER_STREAM_INPUT_H

#include "output_sink.h"
#include <textexpander/engine.h>
#include <functional>
#include <istream>
#include <string>

namespace textexpander {

/**
 * Feeds text to the engine as if it were typed.
 *
 * '\n' and '\r' act as Enter (reset), '\b' and DEL as Backspace.
 * Every edit the engine emits goes to the sink.
 */
class StreamInput {
public:
    StreamInput(ExpansionEngine& engine, OutputSink& sink);

    // Called between lines; return false to stop reading
    void setLineHook(std::function<bool()> hook) { lineHook_ = std::move(hook); }

    Result feed(const std::string& utf8);

    // Reads to EOF, one line at a time
    Result run(std::istream& in);

    size_t expansions() const { return expansions_; }

    static InputEvent eventFor(char32_t ch);

private:
    ExpansionEngine& engine_;
    OutputSink& sink_;
    std::function<bool()> lineHook_;
    size_t expansions_;
};

} // namespace textexpander

#endif // TEXTEXPANDER_STREAM_INPUT_H
