#pragma once

#include "include/core/SkCanvas.h"

#include "style.hpp"

enum class GlyphKind { Pointer, Hand };

// Width/height ratio of the glyph outline
double glyph_aspect(GlyphKind kind);

// Draws a cursor glyph `height` pixels tall. The pointer tip lands on (x, y);
// the hand is shifted left by 0.28 of its width so the fingertip does.
void draw_cursor_glyph(SkCanvas* canvas, double x, double y, double height, CursorGlyph style, GlyphKind kind,
                       double alpha);
