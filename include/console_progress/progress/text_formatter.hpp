#pragma once

#include "display_config.hpp"
#include "progress_state.hpp"
#include <string>
#include <cstddef>

namespace console_progress {
namespace progress {

// Builds one frame of the progress line:
//   bar + percent + spinner + runtime + ETA, trailing spaces trimmed.
// Runtime and ETA only appear while 0 < fraction < 1; the spinner is dropped
// once the fraction reaches exactly 1.
std::string formatProgressText(double fraction,
                               Clock::duration elapsed,
                               size_t animation_index,
                               const DisplayConfig& config);

std::string buildBar(double fraction, const DisplayConfig& config);

// Whole percent padded with U+00A0 to four glyphs, e.g. "  7%".
std::string formatPercent(double fraction);

// h:mm:ss.f with a leading "0:" and then "00:" stripped.
std::string formatRuntime(Clock::duration elapsed);

// Remaining time extrapolated from the elapsed time, h:mm:ss stripped the
// same way as the runtime.
std::string formatEta(double fraction, Clock::duration elapsed);

std::string animationFrame(const std::string& sequence, size_t animation_index);

}}
