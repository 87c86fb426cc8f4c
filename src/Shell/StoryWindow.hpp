#pragma once

#include <SDL3/SDL.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace storyline {

/**
 * StoryWindow
 *
 * SDL3 text window used as the story console by storyline-window. Output is a
 * scrolling character grid drawn with SDL's built-in debug font; input is
 * a line editor fed by text input events. print() and readLine() have the
 * same contract as the stdout/stdin console, so the dispatcher is unaware
 * of which one it talks to.
 */
class StoryWindow {
public:
    StoryWindow();
    ~StoryWindow();

    StoryWindow(const StoryWindow&) = delete;
    StoryWindow& operator=(const StoryWindow&) = delete;

    bool initialize(const std::string& title);

    // Append one line of story text
    void print(const std::string& text);

    // Block until Enter; nullopt once the window has been closed
    std::optional<std::string> readLine();

    // Show a closing message and wait for a key press or the window to close
    void waitForClose(const std::string& message);

private:
    struct Color {
        uint8_t r, g, b, a;
    };
    static constexpr Color BACKGROUND = {0, 0, 0, 255};
    static constexpr Color FOREGROUND = {170, 170, 170, 255};
    static constexpr Color INPUT = {255, 255, 85, 255};

    static constexpr int CHAR_SIZE = SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE;
    static constexpr float SCALE = 2.0f;
    static constexpr int COLS = 72;
    static constexpr int ROWS = 28;

    SDL_Window* window;
    SDL_Renderer* renderer;
    bool running;

    // Text buffer, one string per screen row
    std::vector<std::string> screen;
    int cursorY;

    // Line editor state
    bool waitingForInput;
    bool inputReady;
    std::string pendingInput;
    bool cursorVisible;
    uint64_t lastCursorBlink;

    void cleanup();
    void newLine();
    void scrollUp();
    void pumpEvents();
    void handleEvent(const SDL_Event& event);
    void render();
};

} // namespace storyline
