#include "tui/tui.h"
#include "screens.h"
#include "quantum/simulation.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <mutex>
#include <vector>
#include <unistd.h>
#include <ncurses.h>

namespace qkdsim {
namespace tui {

struct TUI::Impl {
    bool running = false;
    bool active = false;
    const std::atomic<bool>* stop = nullptr;
    std::string title;
    std::string status;
    Color statusColor = Color::GREEN;
    std::vector<std::string> lines;
    long scroll = 0;
    std::string helpLine;
    std::string lastWarning;
    mutable std::mutex warningMtx;

    int visibleRows() const {
        int rows = LINES - 12;
        return rows > 1 ? rows : 1;
    }
};

TUI::TUI() : impl_(std::make_unique<Impl>()) {
    std::vector<std::string> help(VIEWER_HELP, VIEWER_HELP + VIEWER_HELP_LINES);
    impl_->helpLine = utils::Formatter::join(help, " | ");
}

TUI::~TUI() {
    shutdown();
}

bool TUI::init() {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        return false;
    }

    WINDOW* w = initscr();
    if (!w) {
        return false;
    }

    if (LINES < 20 || COLS < 60) {
        endwin();
        return false;
    }

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_GREEN, -1);
        init_pair(2, COLOR_YELLOW, -1);
        init_pair(3, COLOR_RED, -1);
        init_pair(4, COLOR_CYAN, -1);
        init_pair(5, COLOR_MAGENTA, -1);
    }

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(100);

    impl_->active = true;
    impl_->running = true;
    // console output would tear the curses screen
    utils::Logger::enableConsole(false);
    Impl* impl = impl_.get();
    utils::Logger::onLog([impl](const utils::LogEntry& entry) {
        if (entry.level < utils::LogLevel::WARN) return;
        std::lock_guard<std::mutex> lock(impl->warningMtx);
        impl->lastWarning = entry.message;
    });
    return true;
}

void TUI::shutdown() {
    if (impl_->active) {
        utils::Logger::onLog(nullptr);
        endwin();
        impl_->active = false;
        utils::Logger::enableConsole(true);
    }
    impl_->running = false;
}

void TUI::setStopFlag(const std::atomic<bool>* stop) {
    impl_->stop = stop;
}

void TUI::showReport(const quantum::SimulationReport& report) {
    impl_->title = "Message: " + report.message;
    impl_->lines = buildTranscriptLines(report);
    impl_->scroll = 0;
    impl_->status = "Simulation complete! " + std::to_string(report.siftedKey.size()) + " of " +
                    std::to_string(report.roundsUsed) + " rounds kept";
    impl_->statusColor = report.roundTripOk ? Color::GREEN : Color::RED;
}

void TUI::drawBox(int y, int x, int h, int w, const std::string& title) {
    mvhline(y, x + 1, ACS_HLINE, w - 2);
    mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
    mvvline(y + 1, x, ACS_VLINE, h - 2);
    mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + w - 1, ACS_URCORNER);
    mvaddch(y + h - 1, x, ACS_LLCORNER);
    mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);
    if (!title.empty()) {
        mvprintw(y, x + 2, " %s ", title.c_str());
    }
}

void TUI::drawText(int y, int x, const std::string& text, Color color) {
    int pair = static_cast<int>(color);
    if (pair != 0 && has_colors()) attron(COLOR_PAIR(pair));
    mvprintw(y, x, "%s", text.c_str());
    if (pair != 0 && has_colors()) attroff(COLOR_PAIR(pair));
}

void TUI::run() {
    if (!impl_->active) return;

    while (impl_->running) {
        if (impl_->stop && impl_->stop->load()) break;

        erase();
        int logoRows = QKDSIM_LOGO_LINES < LINES / 3 ? QKDSIM_LOGO_LINES : 0;
        for (int i = 0; i < logoRows; i++) {
            drawText(i, 2, QKDSIM_LOGO[i], Color::CYAN);
        }

        int top = logoRows + 1;
        drawText(top, 2, impl_->title, Color::YELLOW);

        int rows = impl_->visibleRows();
        int boxTop = top + 1;
        int boxHeight = rows + 2;
        if (boxTop + boxHeight > LINES - 3) boxHeight = LINES - 3 - boxTop;
        if (boxHeight < 3) boxHeight = 3;
        rows = boxHeight - 2;
        drawBox(boxTop, 0, boxHeight, COLS, "Transcript");

        impl_->scroll = static_cast<long>(clampScroll(impl_->scroll, impl_->lines.size(), rows));
        for (int i = 0; i < rows; i++) {
            size_t idx = static_cast<size_t>(impl_->scroll) + i;
            if (idx >= impl_->lines.size()) break;
            std::string line = impl_->lines[idx];
            if (static_cast<int>(line.size()) > COLS - 4) line = line.substr(0, COLS - 4);
            drawText(boxTop + 1 + i, 2, line);
        }

        std::string warning;
        {
            std::lock_guard<std::mutex> lock(impl_->warningMtx);
            warning = impl_->lastWarning;
        }
        if (!warning.empty()) {
            if (static_cast<int>(warning.size()) > COLS - 4) warning = warning.substr(0, COLS - 4);
            drawText(LINES - 3, 2, warning, Color::YELLOW);
        }
        drawText(LINES - 2, 2, impl_->status, impl_->statusColor);
        drawText(LINES - 1, 2, impl_->helpLine);
        ::refresh();

        int ch = getch();
        switch (ch) {
            case 'q':
            case 'Q':
                impl_->running = false;
                break;
            case KEY_UP:
                impl_->scroll--;
                break;
            case KEY_DOWN:
                impl_->scroll++;
                break;
            case KEY_PPAGE:
                impl_->scroll -= rows;
                break;
            case KEY_NPAGE:
                impl_->scroll += rows;
                break;
            case KEY_HOME:
                impl_->scroll = 0;
                break;
            case KEY_END:
                impl_->scroll = static_cast<long>(impl_->lines.size());
                break;
            default:
                break;
        }
    }
}

}
}
