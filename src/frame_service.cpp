// ============================================================================
//  File: src/frame_service.cpp — Contexte de rendu des cadres
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "frame_service.hpp"
#include "gallery_log.hpp"

#include <exception>

namespace EinkGallery
{

FrameService::FrameService(ProfileStore& profiles, const ImageCatalog& catalog, RenderPool& pool,
                           bool dither)
    : profiles_(profiles),
      catalog_(catalog),
      pool_(pool),
      dither_(dither),
      rng_(std::random_device{}())
{
}

void FrameService::seed(std::mt19937::result_type s)
{
    std::lock_guard<std::mutex> lk(rng_mu_);
    rng_.seed(s);
}

bool FrameService::render_bytes(const std::string& panel, const std::vector<uint8_t>& bytes, bool crop,
                                std::vector<uint8_t>& png, GalleryError* err)
{
    std::optional<DisplayProfile> profile = profiles_.load(panel, err);
    if(!profile) return false;

    RenderOptions opt;
    opt.crop   = crop;
    opt.dither = dither_;

    RenderedFrame frame;
    GalleryError  jobErr;
    auto fut = pool_.submit([&]()
    {
        return render_image(bytes, *profile, opt, frame, &jobErr);
    });
    if(!fut.valid())
    {
        return fail(err, ErrorKind::Internal, "Render pool is not accepting work");
    }

    bool ok = false;
    try
    {
        ok = fut.get();
    }
    catch(const std::exception& e)
    {
        log_error(std::string("render job for ") + panel + " threw: " + e.what());
        return fail(err, ErrorKind::Internal, "Rendering failed");
    }
    if(!ok)
    {
        if(err) *err = jobErr;
        return false;
    }
    png.swap(frame.png);
    return true;
}

bool FrameService::render_upload(const UploadRequest& req, std::vector<uint8_t>& png, GalleryError* err)
{
    if(req.source.empty()) return fail(err, ErrorKind::InvalidArgument, "No image data provided");
    return render_bytes(req.panel, req.source, req.crop, png, err);
}

bool FrameService::render_named(const std::string& panel, const std::string& filename, bool crop,
                                std::vector<uint8_t>& png, GalleryError* err)
{
    if(filename.empty()) return fail(err, ErrorKind::InvalidArgument, "No image filename provided");

    std::vector<ImageRecord> images;
    if(!catalog_.list_images(images, err)) return false;

    // nom exact, puis sans extension; sinon on tente le nom tel quel
    std::string resolved;
    if(!find_image_by_basename(images, filename, resolved)) resolved = filename;

    std::vector<uint8_t> bytes;
    if(!catalog_.read_image_bytes(resolved, bytes, err)) return false;
    log_info("Rendering " + resolved + " for " + panel);
    return render_bytes(panel, bytes, crop, png, err);
}

bool FrameService::select(const SelectionRequest& req, SelectionResult& out, GalleryError* err)
{
    std::vector<ImageRecord> images;
    if(!catalog_.list_images(images, err)) return false;
    std::lock_guard<std::mutex> lk(rng_mu_);
    return select_from(images, req, rng_, out, err);
}

bool FrameService::render_selection(const SelectionRenderRequest& req, SelectionRender& out,
                                    GalleryError* err)
{
    SelectionRequest sel;
    sel.policy        = req.policy;
    sel.tag_filter    = req.tag_filter;
    sel.current_index = req.current_index;

    SelectionResult picked;
    if(!select(sel, picked, err)) return false;

    std::vector<uint8_t> bytes;
    if(!catalog_.read_image_bytes(picked.image.filename, bytes, err)) return false;
    log_info(std::string("Rendering ") + picked.image.filename + " for " + req.panel
             + " (" + selection_policy_name(req.policy) + ")");
    if(!render_bytes(req.panel, bytes, req.crop, out.png, err)) return false;

    out.filename = picked.image.filename;
    out.index    = picked.index;
    return true;
}

} // namespace EinkGallery
