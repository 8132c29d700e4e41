#pragma once

#include "main_command.hpp"
#include "progressbar/common/config.hpp"
#include <CLI/CLI.hpp>
#include <atomic>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace progressbar {
namespace core {
class ProgressBar;
}

namespace cli {

// Advances a progress bar once per line read from the input stream.
class PipeCommand : public MainCommand {
public:
    PipeCommand();
    
    void setup(CLI::App* app);
    bool validateArguments() const override;
    
    // Installs the interrupt handlers and runs on the standard streams.
    int execute();
    int run(std::istream& in, std::ostream& out, std::ostream& err);
    
    static void requestInterrupt();
    static void clearInterrupt();
    static bool interruptRequested();

private:
    int64_t total_ = 0;
    double interval_ = 0.0;
    CLI::Option* interval_option_ = nullptr;
    bool no_summary_ = false;
    std::string color_;
    std::string report_;
    
    static std::atomic<bool> interrupt_requested_;
    
    bool resolveColors(common::ColorMode mode) const;
    common::ReportFormat resolveReportFormat() const;
    void emitReport(const core::ProgressBar& bar, common::ReportFormat report_format, std::ostream& err) const;
    
    static void installSignalHandlers();
    static void signalHandler(int signal);
};

}}
