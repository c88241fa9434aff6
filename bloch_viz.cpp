// bloch_viz.cpp
#include "bloch_viz.hpp"
#include "bloch_math.hpp"
#include <SDL.h>
#include <cmath>
#include <algorithm>

namespace bloch::viz {

    Projected project(const CartesianCoordinates& v, int cx, int cy, int R, const BlochViewConfig& cfg)
    {
        const double yaw = cfg.yaw_deg * PI / 180.0;
        const double pitch = cfg.pitch_deg * PI / 180.0;
        const double cyaw = std::cos(yaw), syaw = std::sin(yaw);
        const double cp = std::cos(pitch), sp = std::sin(pitch);

        // right, up and towards-viewer axes of the camera
        const CartesianCoordinates right{-syaw, cyaw, 0.0};
        const CartesianCoordinates up{-sp * cyaw, -sp * syaw, cp};
        const CartesianCoordinates toward{cp * cyaw, cp * syaw, sp};

        const double sx = dot(v, right);
        const double sy = dot(v, up);
        return Projected{cx + (int)std::round(sx * R), cy - (int)std::round(sy * R), dot(v, toward)};
    }

    bool show_bloch_sphere(const SphericalCoordinates& state, const TrajectoryHistory& history,
                           const BlochViewConfig& cfg, const char* title)
    {
        const int W = cfg.sphere_size + 2 * cfg.margin;
        const int H = cfg.sphere_size + 2 * cfg.margin + (cfg.draw_probabilities ? 40 : 0);

        if (!sdlm::ensure_window(sdlm::M().sphere, W, H, title)) return false;
        Painter pen(sdlm::M().sphere.surf);
        pen.clear(pen.color(12, 12, 14));

        const int cx = cfg.margin + cfg.sphere_size / 2;
        const int cy = cfg.margin + cfg.sphere_size / 2;
        const int R = (cfg.sphere_size / 2) - 10;

        // silhouette
        pen.circle(cx, cy, R, pen.color(74, 144, 217));

        if (cfg.draw_equator) {
            const Uint32 front = pen.color(110, 110, 130);
            const Uint32 back  = pen.color(45, 45, 55);
            const int segments = 144;
            Projected prev = project(CartesianCoordinates{1.0, 0.0, 0.0}, cx, cy, R, cfg);
            for (int i = 1; i <= segments; ++i) {
                const double a = TWO_PI * i / segments;
                Projected p = project(CartesianCoordinates{std::cos(a), std::sin(a), 0.0}, cx, cy, R, cfg);
                pen.line(prev, p, (p.depth >= 0.0) ? front : back);
                prev = p;
            }
        }

        if (cfg.draw_axes) {
            auto axis = [&](const CartesianCoordinates& dir, Uint32 col) {
                Projected a = project(CartesianCoordinates{-dir.x, -dir.y, -dir.z}, cx, cy, R, cfg);
                Projected b = project(dir, cx, cy, R, cfg);
                pen.line(a, b, col);
            };
            axis(CartesianCoordinates{1.0, 0.0, 0.0}, pen.color(220, 40, 40));
            axis(CartesianCoordinates{0.0, 1.0, 0.0}, pen.color(40, 200, 40));
            axis(CartesianCoordinates{0.0, 0.0, 1.0}, pen.color(60, 60, 230));

            // |0> and |1> markers
            const Uint32 label_col = pen.color(150, 150, 160);
            Projected north = project(CartesianCoordinates{0.0, 0.0, 1.0}, cx, cy, R, cfg);
            Projected south = project(CartesianCoordinates{0.0, 0.0, -1.0}, cx, cy, R, cfg);
            pen.fill(north.x - 3, north.y - 10, 6, 6, label_col);
            pen.fill(south.x - 3, south.y + 4, 6, 6, label_col);
        }

        if (cfg.draw_trajectory && history.size() > 1) {
            const auto pts = history.cartesian_points();
            const int n = (int)pts.size();
            Projected prev = project(pts[0], cx, cy, R, cfg);
            for (int i = 1; i < n; ++i) {
                Projected p = project(pts[i], cx, cy, R, cfg);
                // older segments fade out
                const double age = (double)i / (double)(n - 1);
                const int k = 60 + (int)(age * 195.0);
                pen.line(prev, p, pen.color(k, (int)(k * 0.42), (int)(k * 0.42)));
                prev = p;
            }
        }

        if (cfg.draw_state_vector) {
            Projected tip = project(spherical_to_cartesian(state), cx, cy, R, cfg);
            const bool in_front = tip.depth >= 0.0;
            Uint32 vec_col  = in_front ? pen.color(255, 68, 68) : pen.color(170, 50, 50);
            Uint32 head_col = in_front ? pen.color(255, 120, 120) : pen.color(190, 80, 80);
            pen.arrow(cx, cy, tip.x, tip.y, vec_col, head_col, 12.0, 22.0);
            pen.fill(tip.x - 2, tip.y - 2, 5, 5, head_col);
        }

        if (cfg.draw_probabilities) {
            const auto p = probabilities(state);
            const int bar_x = cfg.margin;
            const int bar_y = cfg.margin + cfg.sphere_size + 10;
            const int bar_w = cfg.sphere_size;
            const int bar_h = 10;

            pen.fill(bar_x, bar_y, bar_w, bar_h, pen.color(40, 40, 50));
            // P(|0>) green, P(|1>) red
            const int p0_w = (int)std::round(p.first * bar_w);
            pen.fill(bar_x, bar_y, p0_w, bar_h, pen.color(80, 180, 100));
            pen.fill(bar_x + p0_w, bar_y, bar_w - p0_w, bar_h, pen.color(180, 80, 100));

            // azimuth marker
            const int phi_y = bar_y + bar_h + 6;
            pen.fill(bar_x, phi_y, bar_w, 4, pen.color(40, 40, 50));
            const int phi_pos = bar_x + (int)(state.phi / TWO_PI * bar_w);
            pen.fill(phi_pos - 2, phi_y - 2, 4, 8, pen.color(230, 230, 240));
        }

        return SDL_UpdateWindowSurface(sdlm::M().sphere.win) == 0;
    }

}
