#pragma once

#include <ostream>
#include <string>

namespace progressbar {
namespace core {

class TerminalSink {
public:
    virtual ~TerminalSink() = default;
    
    virtual void write(const std::string& text) = 0;
    virtual void flush() = 0;
};

class StreamSink : public TerminalSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}
    
    void write(const std::string& text) override;
    void flush() override;

private:
    std::ostream& out_;
};

}}
