// main_win32.cpp
// MazeMaster Win32 frontend: window, 32bpp DIB backbuffer, keyboard polling
// and a fixed 60 Hz update loop. All game logic lives in mazemaster_core.
//
// Build (MinGW/Clang): see CMakeLists.txt, links user32 + gdi32.
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#include <cstring>
#include <exception>
#include <string>

#include "config.h"
#include "game.h"
#include "input.h"
#include "log.h"
#include "render.h"
#include "scene.h"

static BITMAPINFO g_bmpInfo{};
static void* g_pixels = nullptr;
static bool  g_running = true;

static bool keyDown(int vk) { return (GetAsyncKeyState(vk) & 0x8000) != 0; }

static InputState pollKeys(HWND hwnd) {
    InputState in;
    if (GetForegroundWindow() != hwnd) return in; // ignore keys meant for other windows
    in.set(KEY_UP, keyDown(VK_UP));
    in.set(KEY_DOWN, keyDown(VK_DOWN));
    in.set(KEY_LEFT, keyDown(VK_LEFT));
    in.set(KEY_RIGHT, keyDown(VK_RIGHT));
    in.set(KEY_W, keyDown('W'));
    in.set(KEY_A, keyDown('A'));
    in.set(KEY_S, keyDown('S'));
    in.set(KEY_D, keyDown('D'));
    in.set(KEY_SPACE, keyDown(VK_SPACE));
    in.set(KEY_R, keyDown('R'));
    in.set(KEY_ESCAPE, keyDown(VK_ESCAPE));
    return in;
}

static void dispatchPresses(Game& game, uint16_t edges) {
    static const Key PRESS_KEYS[] = { KEY_SPACE, KEY_R, KEY_ESCAPE };
    for (Key k : PRESS_KEYS) {
        if (edges & k) game.onKeyPress(k);
    }
}

static LRESULT CALLBACK WndProc(HWND h, UINT m, WPARAM w, LPARAM l) {
    if (m == WM_DESTROY) { g_running = false; PostQuitMessage(0); return 0; }
    return DefWindowProc(h, m, w, l);
}

static void fail(const std::string& msg) {
    logError(msg);
    MessageBoxA(NULL, msg.c_str(), "MazeMaster", MB_OK | MB_ICONERROR);
}

static int run(HINSTANCE hInst, const GameConfig& cfg) {
    Game game(cfg);
    Framebuffer fb(cfg.windowW, cfg.windowH);

    // Window
    WNDCLASS wc{}; wc.lpszClassName = TEXT("MazeMasterWin"); wc.hInstance = hInst; wc.lpfnWndProc = WndProc; wc.hCursor = LoadCursor(NULL, IDC_ARROW);
    if (!RegisterClass(&wc)) { fail("RegisterClass failed"); return 1; }

    DWORD style = WS_OVERLAPPEDWINDOW & ~(WS_MAXIMIZEBOX | WS_THICKFRAME);
    RECT wr{ 0, 0, cfg.windowW, cfg.windowH };
    AdjustWindowRect(&wr, style, FALSE);
    HWND hwnd = CreateWindow(wc.lpszClassName, TEXT("MazeMaster"),
        style, CW_USEDEFAULT, CW_USEDEFAULT, wr.right - wr.left, wr.bottom - wr.top, nullptr, nullptr, hInst, nullptr);
    if (!hwnd) { fail("CreateWindow failed"); return 1; }
    ShowWindow(hwnd, SW_SHOW);

    // Backbuffer
    g_bmpInfo.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    g_bmpInfo.bmiHeader.biWidth = cfg.windowW;
    g_bmpInfo.bmiHeader.biHeight = -cfg.windowH; // top-down
    g_bmpInfo.bmiHeader.biPlanes = 1;
    g_bmpInfo.bmiHeader.biBitCount = 32;
    g_bmpInfo.bmiHeader.biCompression = BI_RGB;

    HDC hdc = GetDC(hwnd);
    HDC memDC = CreateCompatibleDC(hdc);
    HBITMAP dib = CreateDIBSection(hdc, &g_bmpInfo, DIB_RGB_COLORS, &g_pixels, NULL, 0);
    if (!memDC || !dib || !g_pixels) {
        if (dib) DeleteObject(dib);
        if (memDC) DeleteDC(memDC);
        ReleaseDC(hwnd, hdc);
        DestroyWindow(hwnd);
        fail("CreateDIBSection failed");
        return 1;
    }
    HGDIOBJ oldBmp = SelectObject(memDC, dib);

    LARGE_INTEGER freq, t0; QueryPerformanceFrequency(&freq); QueryPerformanceCounter(&t0);
    double acc = 0.0, dt = 1.0 / double(cfg.fps);
    InputState prev;
    MSG msg{};
    while (g_running) {
        while (PeekMessage(&msg, nullptr, 0, 0, PM_REMOVE)) {
            if (msg.message == WM_QUIT) g_running = false;
            TranslateMessage(&msg); DispatchMessage(&msg);
        }
        if (!g_running) break;

        LARGE_INTEGER t1; QueryPerformanceCounter(&t1);
        double elapsed = double(t1.QuadPart - t0.QuadPart) / double(freq.QuadPart);
        t0 = t1; acc += elapsed;
        if (acc > 0.25) acc = 0.25; // don't spiral after a stall (window drag etc.)

        // fixed update loop
        while (acc >= dt) {
            acc -= dt;
            InputState now = pollKeys(hwnd);
            dispatchPresses(game, pressedEdges(now, prev));
            prev = now;
            game.update(now);
        }
        if (game.quitRequested()) break;

        // render
        drawScene(fb, game);
        std::memcpy(g_pixels, fb.px.data(), fb.px.size() * sizeof(uint32_t));
        BitBlt(hdc, 0, 0, cfg.windowW, cfg.windowH, memDC, 0, 0, SRCCOPY);
        Sleep(1);
    }

    // cleanup
    SelectObject(memDC, oldBmp);
    DeleteObject(dib);
    DeleteDC(memDC);
    ReleaseDC(hwnd, hdc);
    if (g_running) DestroyWindow(hwnd);
    logInfo("exit, final score " + std::to_string(game.score()) + ", " + std::to_string(game.adversariesShot()) + " adversaries shot");
    return 0;
}

int APIENTRY WinMain(HINSTANCE hInst, HINSTANCE, LPSTR cmdLine, int) {
    logSubscribe([](const std::string& s) { OutputDebugStringA((s + "\n").c_str()); });

    try {
        GameConfig cfg = parseArgs(splitCommandLine(cmdLine ? cmdLine : ""));
        if (cfg.showHelp) {
            MessageBoxA(NULL, usageText(), "MazeMaster", MB_OK | MB_ICONINFORMATION);
            return 0;
        }
        return run(hInst, cfg);
    }
    catch (const ConfigError& e) {
        fail(std::string("configuration error: ") + e.what());
    }
    catch (const std::exception& e) {
        fail(std::string("fatal: ") + e.what());
    }
    return 1;
}
