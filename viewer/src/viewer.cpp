#include <gestureflow/gestureflow.hpp>
#include <safe_io/utils.hpp>

#define SDL_MAIN_HANDLED
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <SDL3/SDL.h>
#include <SDL3/SDL_opengl.h>
#include <GL/glu.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <numbers>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace
{
    using gestureflow::Command;
    using gestureflow::HandSample;
    using gestureflow::ParticleSnapshot;
    using gestureflow::PointerState;
    using gestureflow::Simulation;
    using gestureflow::SimulationConfig;

    constexpr int circle_segments = 14;

    void setup_opengl_state()
    {
        glDisable(GL_DEPTH_TEST);
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glClearColor(0.04f, 0.04f, 0.07f, 1.0f);
    }

    // World coordinates are screen pixels with y pointing down.
    void setup_projection(int width, int height)
    {
        glViewport(0, 0, width, height);
        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        gluOrtho2D(0.0, static_cast<double>(width), static_cast<double>(height), 0.0);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
    }

    void draw_disc(float x, float y, float radius, float r, float g, float b, float a)
    {
        glBegin(GL_TRIANGLE_FAN);
        glColor4f(r, g, b, a);
        glVertex2f(x, y);
        glColor4f(r, g, b, a * 0.35f);
        for (int s = 0; s <= circle_segments; ++s)
        {
            const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(s) / static_cast<float>(circle_segments);
            glVertex2f(x + std::cos(angle) * radius, y + std::sin(angle) * radius);
        }
        glEnd();
    }

    void draw_particles(const ParticleSnapshot& snapshot)
    {
        for (std::size_t i = 0; i < snapshot.size(); ++i)
        {
            const auto rgb = gestureflow::to_rgb(snapshot.colors[i]);
            const auto& p = snapshot.positions[i];
            const float radius = snapshot.sizes[i] * 0.5f;
            const float alpha = snapshot.trail_alpha[i];

            if (snapshot.is_bubble[i] != 0)
            {
                draw_disc(p.x, p.y, radius * 1.6f, rgb.r, rgb.g, rgb.b, 0.15f);
            }
            draw_disc(p.x, p.y, radius, rgb.r, rgb.g, rgb.b, alpha);
        }
    }

    void draw_hand(const HandSample& hand)
    {
        glColor4f(1.0f, 1.0f, 1.0f, 0.5f);
        glBegin(GL_LINE_LOOP);
        for (int s = 0; s < circle_segments; ++s)
        {
            const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(s) / static_cast<float>(circle_segments);
            glVertex2f(hand.palm.x + std::cos(angle) * 20.0f, hand.palm.y + std::sin(angle) * 20.0f);
        }
        glEnd();
    }

    int run_viewer()
    {
        if (!SDL_Init(SDL_INIT_VIDEO))
        {
            safe_io::error("SDL_Init failed: {}", SDL_GetError());
            return 1;
        }

        int width = 1280, height = 720;
        SDL_PropertiesID props = SDL_CreateProperties();
        SDL_SetStringProperty(props, SDL_PROP_WINDOW_CREATE_TITLE_STRING, "GestureFlow");
        SDL_SetNumberProperty(props, SDL_PROP_WINDOW_CREATE_WIDTH_NUMBER, width);
        SDL_SetNumberProperty(props, SDL_PROP_WINDOW_CREATE_HEIGHT_NUMBER, height);
        SDL_SetBooleanProperty(props, SDL_PROP_WINDOW_CREATE_OPENGL_BOOLEAN, true);
        SDL_SetBooleanProperty(props, SDL_PROP_WINDOW_CREATE_RESIZABLE_BOOLEAN, true);

        SDL_Window* window = SDL_CreateWindowWithProperties(props);
        SDL_DestroyProperties(props);
        if (!window)
        {
            safe_io::error("Window creation failed: {}", SDL_GetError());
            SDL_Quit();
            return 1;
        }

        SDL_GLContext glctx = SDL_GL_CreateContext(window);
        if (!glctx)
        {
            safe_io::error("GL context creation failed: {}", SDL_GetError());
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        SDL_GL_MakeCurrent(window, glctx);
        SDL_GL_SetSwapInterval(1);
        setup_opengl_state();
        setup_projection(width, height);

        SimulationConfig config{};
        config.width = static_cast<float>(width);
        config.height = static_cast<float>(height);
        Simulation simulation{ config };

        std::mt19937 rng(42);
        PointerState pointer{};
        {
            float mx = 0.0f, my = 0.0f;
            SDL_GetMouseState(&mx, &my);
            pointer.position = { mx, my };
            pointer.previous = pointer.position;
        }
        bool running = true, paused = false;
        auto last = std::chrono::steady_clock::now();

        safe_io::print("Controls: left attract, right repel, middle spawn, left+right explode, fast move wave,");
        safe_io::print("          Q/E vortex, C palette, I idle, U/D gravity, +/= spawn, R reset, P pause, Esc exit.");

        while (running)
        {
            std::vector<Command> pending;

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_EVENT_QUIT) running = false;
                else if (e.type == SDL_EVENT_WINDOW_RESIZED)
                {
                    width = e.window.data1;
                    height = e.window.data2;
                    setup_projection(width, height);
                    pending.push_back(gestureflow::commands::Resize{ static_cast<float>(width), static_cast<float>(height) });
                }
                else if (e.type == SDL_EVENT_KEY_DOWN)
                {
                    switch (e.key.scancode)
                    {
                    case SDL_SCANCODE_ESCAPE: running = false; break;
                    case SDL_SCANCODE_P: paused = !paused; break;
                    case SDL_SCANCODE_C: pending.push_back(gestureflow::commands::NextPalette{}); break;
                    case SDL_SCANCODE_I: pending.push_back(gestureflow::commands::SetIdle{ !simulation.idle_mode() }); break;
                    case SDL_SCANCODE_U: pending.push_back(gestureflow::commands::SetGravity{ -1.0f }); break;
                    case SDL_SCANCODE_D: pending.push_back(gestureflow::commands::SetGravity{ 1.0f }); break;
                    case SDL_SCANCODE_R:
                        // Reset restores the configured world size; follow the window instead.
                        pending.push_back(gestureflow::commands::Reset{});
                        pending.push_back(gestureflow::commands::Resize{ static_cast<float>(width), static_cast<float>(height) });
                        break;
                    case SDL_SCANCODE_EQUALS:
                    case SDL_SCANCODE_KP_PLUS:
                    {
                        std::uniform_real_distribution<float> xs(100.0f, std::max(101.0f, static_cast<float>(width) - 100.0f));
                        std::uniform_real_distribution<float> ys(100.0f, std::max(101.0f, static_cast<float>(height) - 100.0f));
                        for (int i = 0; i < 50; ++i)
                        {
                            pending.push_back(gestureflow::commands::Spawn{ xs(rng), ys(rng), {} });
                        }
                        break;
                    }
                    default: break;
                    }
                }
            }

            float mx = 0.0f, my = 0.0f;
            const SDL_MouseButtonFlags buttons = SDL_GetMouseState(&mx, &my);
            const bool* keys = SDL_GetKeyboardState(nullptr);
            pointer.previous = pointer.position;
            pointer.position = { mx, my };
            pointer.left = (buttons & SDL_BUTTON_LMASK) != 0;
            pointer.middle = (buttons & SDL_BUTTON_MMASK) != 0;
            pointer.right = (buttons & SDL_BUTTON_RMASK) != 0;
            pointer.rotate_ccw = keys[SDL_SCANCODE_Q];
            pointer.rotate_cw = keys[SDL_SCANCODE_E];

            const std::optional<HandSample> hand = gestureflow::hand_from_pointer(pointer);
            if (hand)
            {
                const std::vector<HandSample> hands{ *hand };
                for (auto& command : gestureflow::bind_hands(hands))
                {
                    pending.push_back(std::move(command));
                }
            }

            for (const auto& command : pending)
            {
                const auto feedback = gestureflow::dispatch(simulation, command);
                if (!feedback.accepted)
                {
                    safe_io::debug("{} command had no effect", gestureflow::command_name(command));
                }
            }

            const auto now = std::chrono::steady_clock::now();
            const double frame = std::chrono::duration<double>(now - last).count();
            last = now;
            if (!paused)
            {
                // dt is measured in 60 fps frames.
                simulation.update(static_cast<float>(std::min(frame, 0.05) * 60.0));
            }

            glClear(GL_COLOR_BUFFER_BIT);
            draw_particles(simulation.snapshot());
            if (hand)
            {
                draw_hand(*hand);
            }
            SDL_GL_SwapWindow(window);
        }

        SDL_GL_DestroyContext(glctx);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }
}

int main()
{
    safe_io::configure_level_from_env();
    try
    {
        return run_viewer();
    }
    catch (const std::exception& ex)
    {
        safe_io::eprint("gestureflow_viewer failed: {}", ex.what());
        return 1;
    }
}
