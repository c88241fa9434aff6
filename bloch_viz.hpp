#pragma once
#include <SDL.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "bloch_common.hpp"
#include "trajectory.hpp"

namespace bloch::viz {

    namespace sdlm {
        struct Win { SDL_Window* win=nullptr; SDL_Surface* surf=nullptr; int W=0,H=0; };
        struct Manager { bool inited=false; Win sphere; };
        inline Manager& M(){ static Manager m; return m; }

        inline bool ensure_sdl() {
            auto& m = M();
            if (!m.inited) { if (SDL_Init(SDL_INIT_VIDEO) < 0) return false; m.inited = true; }
            return true;
        }
        inline bool ensure_window(Win& w, int W, int H, const char* title) {
            if (!ensure_sdl()) return false;
            if (!w.win || w.W != W || w.H != H) {
                if (w.win) SDL_DestroyWindow(w.win);
                w.win = SDL_CreateWindow(title, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, W, H, SDL_WINDOW_SHOWN);
                if (!w.win) return false;
                SDL_SetWindowResizable(w.win, SDL_FALSE);
                w.surf = SDL_GetWindowSurface(w.win); w.W=W; w.H=H;
                return w.surf != nullptr;
            }
            SDL_SetWindowTitle(w.win, title);
            // SDL may hand back a new surface after the window is re-exposed
            w.surf = SDL_GetWindowSurface(w.win);
            return w.surf != nullptr;
        }
        inline void destroy_window(Win& w) {
            if (w.win) SDL_DestroyWindow(w.win);
            w.win = nullptr; w.surf = nullptr; w.W = w.H = 0;
        }
    }

    // Orthographic projection of a Bloch vector. Returns screen x, y and depth
    // (positive towards the viewer).
    struct Projected { int x, y; double depth; };

    // Draws straight into a window surface, which needs no SDL_LockSurface.
    // Everything clips to the surface bounds.
    class Painter {
    public:
        explicit Painter(SDL_Surface* surf) : s_(surf) {}

        Uint32 color(int r, int g, int b) const {
            auto c8 = [](int v) { return static_cast<Uint8>(std::clamp(v, 0, 255)); };
            return SDL_MapRGB(s_->format, c8(r), c8(g), c8(b));
        }

        void clear(Uint32 c) { SDL_FillRect(s_, nullptr, c); }

        void plot(int x, int y, Uint32 c) {
            if (x < 0 || y < 0 || x >= s_->w || y >= s_->h) return;
            auto* row = static_cast<Uint8*>(s_->pixels) + static_cast<std::ptrdiff_t>(y) * s_->pitch;
            reinterpret_cast<Uint32*>(row)[x] = c;
        }

        // DDA along the major axis
        void line(int x0, int y0, int x1, int y1, Uint32 c) {
            const int steps = std::max(std::abs(x1 - x0), std::abs(y1 - y0));
            if (steps == 0) { plot(x0, y0, c); return; }
            const double ix = double(x1 - x0) / steps, iy = double(y1 - y0) / steps;
            for (int k = 0; k <= steps; ++k)
                plot(x0 + (int)std::lround(ix * k), y0 + (int)std::lround(iy * k), c);
        }
        void line(const Projected& a, const Projected& b, Uint32 c) { line(a.x, a.y, b.x, b.y, c); }

        void fill(int x, int y, int w, int h, Uint32 c) {
            if (w <= 0 || h <= 0) return;
            SDL_Rect rc{x, y, w, h};
            SDL_FillRect(s_, &rc, c);
        }

        // Midpoint circle, one octant mirrored eight ways
        void circle(int cx, int cy, int r, Uint32 c) {
            int x = r, y = 0, d = 1 - r;
            while (x >= y) {
                const int pts[8][2] = {{x, y}, {y, x}, {-y, x}, {-x, y},
                                       {-x, -y}, {-y, -x}, {y, -x}, {x, -y}};
                for (const auto& p : pts) plot(cx + p[0], cy + p[1], c);
                ++y;
                if (d < 0) d += 2 * y + 1;
                else { --x; d += 2 * (y - x) + 1; }
            }
        }

        // Shaft from->to with a two-stroke head at `to`; head_deg is the
        // half-angle of the head.
        void arrow(int x0, int y0, int x1, int y1, Uint32 shaft, Uint32 head,
                   double head_len, double head_deg) {
            line(x0, y0, x1, y1, shaft);
            const double len = std::hypot(double(x1 - x0), double(y1 - y0));
            if (len < 1.0) return;
            // back along the shaft, and across it
            const double bx = (x0 - x1) / len, by = (y0 - y1) / len;
            const double along = head_len * std::cos(head_deg * PI / 180.0);
            const double across = head_len * std::sin(head_deg * PI / 180.0);
            for (int side : {1, -1}) {
                const double hx = x1 + bx * along - by * across * side;
                const double hy = y1 + by * along + bx * across * side;
                line(x1, y1, (int)std::lround(hx), (int)std::lround(hy), head);
            }
        }

    private:
        SDL_Surface* s_;
    };

    struct BlochViewConfig {
        int sphere_size = 480;
        int margin = 20;
        int min_frame_ms = 16;
        // camera direction, the default looks from (2.5, 2.5, 2.5)
        double yaw_deg = 45.0;
        double pitch_deg = 35.264;
        bool draw_axes = true;
        bool draw_equator = true;
        bool draw_state_vector = true;
        bool draw_trajectory = true;
        bool draw_probabilities = true;
    };

    Projected project(const CartesianCoordinates& v, int cx, int cy, int R, const BlochViewConfig& cfg);

    bool show_bloch_sphere(const SphericalCoordinates& state, const TrajectoryHistory& history,
                           const BlochViewConfig& cfg, const char* title);

    enum class Command { None, Prev, Next, Jump, Random, ToggleAnimation, ClearTrajectory, Quit };

    // Non-blocking; jump_index is set for Command::Jump (index into common_states::all).
    inline Command poll_command(int& jump_index){
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            if (ev.type == SDL_QUIT) return Command::Quit;
            if (ev.type != SDL_KEYDOWN) continue;
            switch (ev.key.keysym.sym) {
                case SDLK_LEFT:                 return Command::Prev;
                case SDLK_RIGHT: case SDLK_SPACE: return Command::Next;
                case SDLK_0:     jump_index = 0; return Command::Jump;
                case SDLK_p:     jump_index = 1; return Command::Jump;
                case SDLK_i:     jump_index = 2; return Command::Jump;
                case SDLK_1:     jump_index = 3; return Command::Jump;
                case SDLK_m:     jump_index = 4; return Command::Jump;
                case SDLK_k:     jump_index = 5; return Command::Jump;
                case SDLK_r:                    return Command::Random;
                case SDLK_a:                    return Command::ToggleAnimation;
                case SDLK_c:                    return Command::ClearTrajectory;
                case SDLK_ESCAPE: case SDLK_q:  return Command::Quit;
                default: break;
            }
        }
        return Command::None;
    }

    inline void shutdown(){
        sdlm::destroy_window(sdlm::M().sphere);
        if (sdlm::M().inited) SDL_Quit();
        sdlm::M().inited = false;
    }

}
