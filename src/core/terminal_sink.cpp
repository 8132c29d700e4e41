#include "progressbar/core/terminal_sink.hpp"

namespace progressbar {
namespace core {

void StreamSink::write(const std::string& text) {
    out_ << text;
}

void StreamSink::flush() {
    out_ << std::flush;
}

}}
