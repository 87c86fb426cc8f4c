#include "StoryWindow.hpp"

#include <iostream>
#include <utility>

namespace storyline {

StoryWindow::StoryWindow()
    : window(nullptr), renderer(nullptr), running(false),
      screen(ROWS), cursorY(0),
      waitingForInput(false), inputReady(false),
      cursorVisible(true), lastCursorBlink(0) {}

StoryWindow::~StoryWindow() {
    cleanup();
}

bool StoryWindow::initialize(const std::string& title) {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        std::cerr << "SDL initialization failed: " << SDL_GetError() << std::endl;
        return false;
    }

    const int width = static_cast<int>(COLS * CHAR_SIZE * SCALE);
    const int height = static_cast<int>((ROWS + 1) * CHAR_SIZE * SCALE);
    window = SDL_CreateWindow(title.c_str(), width, height, 0);
    if (!window) {
        std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_SetRenderScale(renderer, SCALE, SCALE);

    running = true;
    render();
    return true;
}

void StoryWindow::cleanup() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_StopTextInput(window);
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    running = false;
    SDL_Quit();
}

void StoryWindow::print(const std::string& text) {
    // Word wrap at the column limit; embedded newlines start a new row
    size_t pos = 0;
    do {
        size_t end = text.find('\n', pos);
        std::string segment = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        while (segment.size() > static_cast<size_t>(COLS)) {
            size_t cut = segment.rfind(' ', COLS);
            if (cut == std::string::npos || cut == 0) cut = COLS;
            screen[cursorY] = segment.substr(0, cut);
            newLine();
            segment.erase(0, cut == static_cast<size_t>(COLS) ? cut : cut + 1);
        }
        screen[cursorY] = segment;
        newLine();
        pos = (end == std::string::npos) ? text.size() : end + 1;
    } while (pos < text.size());

    if (running) render();
}

void StoryWindow::newLine() {
    cursorY++;
    if (cursorY >= ROWS) {
        scrollUp();
        cursorY = ROWS - 1;
    }
}

void StoryWindow::scrollUp() {
    for (int y = 0; y < ROWS - 1; y++) {
        screen[y] = std::move(screen[y + 1]);
    }
    screen[ROWS - 1].clear();
}

std::optional<std::string> StoryWindow::readLine() {
    if (!running) return std::nullopt;

    waitingForInput = true;
    inputReady = false;
    pendingInput.clear();
    SDL_StartTextInput(window);

    while (running && !inputReady) {
        pumpEvents();

        // Update cursor blink
        uint64_t now = SDL_GetTicks();
        if (now - lastCursorBlink > 500) {
            cursorVisible = !cursorVisible;
            lastCursorBlink = now;
        }

        render();
        SDL_Delay(16); // ~60 FPS
    }

    waitingForInput = false;
    if (window) SDL_StopTextInput(window);
    if (!inputReady) return std::nullopt;

    // Echo the answer into the transcript
    std::string answer = pendingInput;
    pendingInput.clear();
    print("> " + answer);
    return answer;
}

void StoryWindow::waitForClose(const std::string& message) {
    if (!running) return;
    print("");
    print(message);

    bool keyPressed = false;
    while (running && !keyPressed) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_KEY_DOWN) {
                keyPressed = true;
            } else {
                handleEvent(event);
            }
        }
        render();
        SDL_Delay(16);
    }
}

void StoryWindow::pumpEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        handleEvent(event);
    }
}

void StoryWindow::handleEvent(const SDL_Event& event) {
    switch (event.type) {
    case SDL_EVENT_QUIT:
    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
        running = false;
        break;

    case SDL_EVENT_TEXT_INPUT:
        if (waitingForInput && event.text.text) {
            pendingInput += event.text.text;
        }
        break;

    case SDL_EVENT_KEY_DOWN:
        if (!waitingForInput) break;
        if (event.key.key == SDLK_RETURN || event.key.key == SDLK_KP_ENTER) {
            inputReady = true;
        } else if (event.key.key == SDLK_BACKSPACE && !pendingInput.empty()) {
            // Drop one UTF-8 sequence
            size_t cut = pendingInput.size() - 1;
            while (cut > 0 && (static_cast<unsigned char>(pendingInput[cut]) & 0xC0) == 0x80) cut--;
            pendingInput.erase(cut);
        }
        break;

    default:
        break;
    }
}

void StoryWindow::render() {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, BACKGROUND.r, BACKGROUND.g, BACKGROUND.b, BACKGROUND.a);
    SDL_RenderClear(renderer);

    SDL_SetRenderDrawColor(renderer, FOREGROUND.r, FOREGROUND.g, FOREGROUND.b, FOREGROUND.a);
    for (int y = 0; y < ROWS; y++) {
        if (!screen[y].empty()) {
            SDL_RenderDebugText(renderer, 0.0f, static_cast<float>(y * CHAR_SIZE), screen[y].c_str());
        }
    }

    // Input line below the transcript
    if (waitingForInput) {
        std::string line = "> " + pendingInput + (cursorVisible ? "_" : " ");
        if (line.size() > static_cast<size_t>(COLS)) {
            line = line.substr(line.size() - COLS);
        }
        SDL_SetRenderDrawColor(renderer, INPUT.r, INPUT.g, INPUT.b, INPUT.a);
        SDL_RenderDebugText(renderer, 0.0f, static_cast<float>(ROWS * CHAR_SIZE), line.c_str());
    }

    SDL_RenderPresent(renderer);
}

} // namespace storyline
