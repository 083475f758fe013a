#include "CompositeRenderer.hpp"
#include <QPainter>
#include "core/Logger.hpp"

namespace rs {

QRectF fitRect(f64 srcWidth, f64 srcHeight, f64 dstWidth, f64 dstHeight) {
    if (srcWidth <= 0.0 || srcHeight <= 0.0 || dstWidth <= 0.0 || dstHeight <= 0.0) {
        return {};
    }

    const f64 srcAspect = srcWidth / srcHeight;
    const f64 dstAspect = dstWidth / dstHeight;

    if (srcAspect > dstAspect) {
        // Wider than the surface: full width, bars top and bottom
        const f64 h = dstWidth / srcAspect;
        return {0.0, (dstHeight - h) / 2.0, dstWidth, h};
    }
    // Taller or equal: full height, bars left and right
    const f64 w = dstHeight * srcAspect;
    return {(dstWidth - w) / 2.0, 0.0, w, dstHeight};
}

CompositeRenderer::CompositeRenderer(u32 width, u32 height, Color background)
    : width_(width),
      height_(height),
      background_(background.r, background.g, background.b, background.a),
      canvas_(static_cast<int>(width), static_cast<int>(height), QImage::Format_RGBA8888) {
    canvas_.fill(background_);
}

void CompositeRenderer::setBackdrop(QImage backdrop) {
    backdrop_ = std::move(backdrop);
    if (backdrop_.isNull()) {
        LOG_WARN("Backdrop image is empty; backdrop frames will be blank");
    }
}

const QImage& CompositeRenderer::compose(const QImage& picture) {
    canvas_.fill(background_);
    drawFitted(picture.isNull() ? backdrop_ : picture);
    ++frames_;
    return canvas_;
}

void CompositeRenderer::drawFitted(const QImage& image) {
    if (image.isNull()) {
        return;
    }

    const QRectF target = fitRect(image.width(), image.height(), width_, height_);
    if (target.isEmpty()) {
        return;
    }

    QPainter painter(&canvas_);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.drawImage(target, image);
}

} // namespace rs
