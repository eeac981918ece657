#pragma once
#include "platform/interface/color.hpp"

enum UserInterfaceRenderingMode {
        /**
         * Outlined rectangles instead of filled rounded ones and no rounded
         * screen border. Cheaper to redraw and easier on the eyes on small
         * screens.
         */
        Minimalistic = 0,
        /**
         * Filled rounded rectangles everywhere, the screen border changes
         * color on game over and on win.
         */
        Detailed = 1,
};

const char *rendering_mode_to_str(UserInterfaceRenderingMode mode);
UserInterfaceRenderingMode rendering_mode_from_str(const char *mode_str);

typedef struct UserInterfaceCustomization {
        /**
         * Accent color of the UI elements. This applies to the menu bars,
         * the selection indicator and the screen border.
         */
        Color accent_color;
        UserInterfaceRenderingMode rendering_mode;
        /**
         * If true, hints explaining which key does what are rendered at the
         * bottom of the menus and of the game screen.
         */
        bool show_help_text;
} UserInterfaceCustomization;
