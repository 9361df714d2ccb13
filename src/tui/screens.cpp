#include "screens.h"
#include "utils/utils.h"

namespace qkdsim {
namespace tui {

const char* QKDSIM_LOGO[] = {
    "   ___  _  ______  ____  _           ",
    "  / _ \\| |/ /  _ \\/ ___|(_)_ __ ___  ",
    " | | | | ' /| | | \\___ \\| | '_ ` _ \\ ",
    " | |_| | . \\| |_| |___) | | | | | | |",
    "  \\__\\_\\_|\\_\\____/|____/|_|_| |_| |_|",
    "                                     ",
    "   BB84 key agreement + XOR cipher   "
};
const int QKDSIM_LOGO_LINES = 7;

const char* VIEWER_HELP[] = {
    "Up/Down  scroll one line",
    "PgUp/PgDn  scroll one page",
    "Home/End  jump to top/bottom",
    "q  quit"
};
const int VIEWER_HELP_LINES = 4;

std::string formatRoundRow(const quantum::Round& round) {
    using utils::Formatter;
    std::string row;
    row += Formatter::padLeft(std::to_string(round.index), 5) + "  ";
    row += std::to_string(round.sent.bit) + "    ";
    row += std::string(1, quantum::basisSymbol(round.sent.basis)) + "     ";
    row += std::string(1, quantum::basisSymbol(round.received.basis)) + "     ";
    row += std::to_string(round.received.measuredBit) + "      ";
    row += round.basesMatch() ? "kept" : "-";
    return row;
}

std::vector<std::string> buildTranscriptLines(const quantum::SimulationReport& report) {
    std::vector<std::string> lines;
    lines.push_back("    #  Bit  Sent  Recv  Result Sift");
    lines.push_back("  ---  ---  ----  ----  ------ ----");
    for (const auto& round : report.transcript) {
        lines.push_back(formatRoundRow(round));
    }
    lines.push_back("");
    lines.push_back("Shared key:     " + quantum::bitsToString(report.siftedKey));
    lines.push_back("Expanded key:   " + quantum::bitsToString(report.expandedKey));
    lines.push_back("Encrypted bits: " + quantum::bitsToString(report.cipherBits));
    lines.push_back("Decrypted msg:  " + report.decryptedMessage);
    return lines;
}

size_t clampScroll(long offset, size_t total, size_t visible) {
    if (offset < 0 || total <= visible) return 0;
    size_t maxOffset = total - visible;
    return static_cast<size_t>(offset) > maxOffset ? maxOffset : static_cast<size_t>(offset);
}

}
}
