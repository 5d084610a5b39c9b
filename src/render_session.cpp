#include "render_session.hpp"

#include <algorithm>

RenderSession::RenderSession(int width, int height)
    : grid_w(std::max(0, width))
    , grid_h(std::max(0, height))
    , cfg(default_config())
{
    fld = build_field(grid_w, grid_h, cfg.window, cfg.variant.kind);
    ++n_field_builds;
    pbuf.resize(grid_w, grid_h);
}

// Regenerate the plane only when the window or the variant kind moved away
// from what the current field was built for.
void RenderSession::ensure_field()
{
    if (fld.generated_from(cfg.window, cfg.variant.kind))
        return;
    fld = build_field(grid_w, grid_h, cfg.window, cfg.variant.kind);
    ++n_field_builds;
}

std::string RenderSession::update(const ConfigPatch& patch)
{
    RenderConfig next;
    std::string err = apply_patch(cfg, patch, next);
    if (!err.empty())
        return err;

    cfg = next;
    ensure_field();
    return {};
}

std::string RenderSession::render_frame()
{
    return cpu.render(fld, cfg, pbuf);
}
