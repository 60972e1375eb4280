/**
 * @file DashboardRenderer.hpp
 * @brief Main entry point for the Dear ImGui dashboard rendering.
 */

#pragma once

#include "ui/DashboardState.hpp"

namespace blogforge::ui {

/**
 * @brief Dashboard rendering entry point. Call once per frame.
 * @param state The shared dashboard state.
 */
void DrawUI(DashboardState& state);

} // namespace blogforge::ui
