#include "stream_input.h"
#include "../utils/log.h"
#include "../utils/utf8.h"

namespace textexpander {

StreamInput::StreamInput(ExpansionEngine& engine, OutputSink& sink)
    : engine_(engine)
    , sink_(sink)
    , expansions_(0) {
}

InputEvent StreamInput::eventFor(char32_t ch) {
    switch (ch) {
        case U'\n':
        case U'\r':
            return InputEvent::Reset(ch);
        case U'\b':
        case 0x7F:
            return InputEvent::Backspace();
        default:
            return InputEvent::Character(ch);
    }
}

Result StreamInput::feed(const std::string& utf8) {
    for (char32_t ch : utils::utf8ToUtf32(utf8)) {
        Instruction instruction = engine_.onEvent(eventFor(ch));
        if (!instruction.isEdit()) {
            continue;
        }

        expansions_++;
        Result result = sink_.apply(instruction);
        if (result != Result::Success) {
            return result;
        }
    }
    return Result::Success;
}

Result StreamInput::run(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (lineHook_ && !lineHook_()) {
            break;
        }

        // getline strips the newline; put it back so the line ends in a reset
        Result result = feed(line + "\n");
        if (result != Result::Success) {
            utils::errorLog("Output failed: " + resultToString(result));
            return result;
        }
    }
    return Result::Success;
}

} // namespace textexpander
