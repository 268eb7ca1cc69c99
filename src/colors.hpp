#pragma once
#include <FL/Fl.H>
#include <FL/fl_draw.H>

// Panel palette. Dark, low saturation, with one blue accent.

namespace Colors {
    // Surfaces
    constexpr unsigned char WINDOW_BG[3]        = {15, 17, 21};   // #0F1115 - Window and menu bar
    constexpr unsigned char CONTENT_BG[3]       = {27, 30, 36};   // #1B1E24 - Area right of the panel
    constexpr unsigned char PANEL_BG[3]         = {22, 24, 29};   // #16181D - Tab panel
    constexpr unsigned char BORDER[3]           = {28, 34, 48};   // #1C2230 - Panel edge

    // Text
    constexpr unsigned char TEXT_PRIMARY[3]     = {227, 230, 238}; // #E3E6EE - Tab titles
    constexpr unsigned char TEXT_SECONDARY[3]   = {166, 173, 187}; // #A6ADBB - Group headers
    constexpr unsigned char TEXT_DISABLED[3]    = {107, 114, 128}; // #6B7280 - Placeholder text

    // Accent
    constexpr unsigned char ACCENT_BLUE[3]      = {122, 162, 247}; // #7AA2F7 - Active tab marker, resize edge
    constexpr unsigned char ACCENT_CYAN[3]      = {42, 195, 222};  // #2AC3DE - Web tab marker

    // Tab state
    constexpr unsigned char ACTIVE_TAB_BG[3]    = {40, 48, 65};    // #283041
    constexpr unsigned char HOVER_BG[3]         = {35, 41, 52};    // #232934
    constexpr unsigned char OUTPUT_ACTIVE[3]    = {158, 206, 106}; // #9ECE6A - Output in the last few seconds
    constexpr unsigned char OUTPUT_UNSEEN[3]    = {224, 175, 104}; // #E0AF68 - Output not yet looked at
    constexpr unsigned char CLOSE_HOVER[3]      = {247, 118, 142}; // #F7768E

    inline Fl_Color rgb(const unsigned char color[3]) {
        return fl_rgb_color(color[0], color[1], color[2]);
    }

    // Alpha blend helper (ghost rows during a drag)
    inline Fl_Color blend(const unsigned char fg[3], const unsigned char bg[3], float alpha) {
        unsigned char r = static_cast<unsigned char>(fg[0] * alpha + bg[0] * (1 - alpha));
        unsigned char g = static_cast<unsigned char>(fg[1] * alpha + bg[1] * (1 - alpha));
        unsigned char b = static_cast<unsigned char>(fg[2] * alpha + bg[2] * (1 - alpha));
        return fl_rgb_color(r, g, b);
    }
}
