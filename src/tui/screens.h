#pragma once

#include "quantum/simulation.h"
#include <string>
#include <vector>

namespace qkdsim {
namespace tui {

extern const char* QKDSIM_LOGO[];
extern const int QKDSIM_LOGO_LINES;

extern const char* VIEWER_HELP[];
extern const int VIEWER_HELP_LINES;

std::string formatRoundRow(const quantum::Round& round);
std::vector<std::string> buildTranscriptLines(const quantum::SimulationReport& report);
size_t clampScroll(long offset, size_t total, size_t visible);

}
}
