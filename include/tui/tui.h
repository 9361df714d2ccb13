#pragma once

#include <atomic>
#include <memory>
#include <string>

struct _win_st;
typedef struct _win_st WINDOW;

namespace qkdsim {
namespace quantum {
struct SimulationReport;
}

namespace tui {

enum class Color {
    DEFAULT = 0,
    GREEN = 1,
    YELLOW = 2,
    RED = 3,
    CYAN = 4,
    MAGENTA = 5
};

class TUI {
public:
    TUI();
    ~TUI();

    bool init();
    void run();
    void shutdown();

    void setStopFlag(const std::atomic<bool>* stop);
    void showReport(const quantum::SimulationReport& report);

    void drawBox(int y, int x, int h, int w, const std::string& title = "");
    void drawText(int y, int x, const std::string& text, Color color = Color::DEFAULT);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
