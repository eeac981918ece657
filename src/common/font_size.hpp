#pragma once

/**
 * Font sizes supported by the displays, the value is the character height in
 * pixels.
 */
typedef enum FontSize {
        Size16 = 16,
        Size24 = 24,
        Size32 = 32,
} FontSize;
