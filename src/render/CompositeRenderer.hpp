/**
 * @file CompositeRenderer.hpp
 * @brief CPU compositor for the output surface.
 *
 * Paints one output frame: clear to the background colour, then draw either
 * the current video picture or the static backdrop, scaled to fit while
 * preserving aspect ratio and centred (letterbox or pillarbox, never
 * stretched, never cropped).
 *
 * @section Dependencies
 * - Qt Gui (QImage, QPainter)
 */

#pragma once
#include <QColor>
#include <QImage>
#include <QRectF>
#include "util/Types.hpp"

namespace rs {

// Largest rectangle of the source's aspect ratio that fits the target, centred
QRectF fitRect(f64 srcWidth, f64 srcHeight, f64 dstWidth, f64 dstHeight);

class CompositeRenderer {
public:
    CompositeRenderer(u32 width, u32 height, Color background = Color::black());

    void setBackdrop(QImage backdrop);
    const QImage& backdrop() const {
        return backdrop_;
    }

    // Clears and draws the picture, or the backdrop when the picture is null
    const QImage& compose(const QImage& picture);
    const QImage& composeBackdrop() {
        return compose(QImage());
    }

    const QImage& surface() const {
        return canvas_;
    }
    u32 width() const {
        return width_;
    }
    u32 height() const {
        return height_;
    }
    u64 framesComposed() const {
        return frames_;
    }

private:
    void drawFitted(const QImage& image);

    u32 width_;
    u32 height_;
    QColor background_;
    QImage backdrop_;
    QImage canvas_;
    u64 frames_{0};
};

} // namespace rs
