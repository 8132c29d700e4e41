#pragma once

#include <string>

namespace progressbar {
namespace core {

// "250 ms", "5.00 seconds", "1 minutes 35 seconds", "2 hours 5 minutes", "1.04 days".
std::string formatDuration(double seconds);

}}
