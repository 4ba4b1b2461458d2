// ============================================================================
//  File: src/render_pipeline.cpp — Rendu photo → bitmap panneau
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "render_pipeline.hpp"

#include "exif_orientation.hpp"
#include "gallery_log.hpp"
#include "image_decode.hpp"
#include "resample.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>

namespace EinkGallery
{

namespace
{

std::string dims(int w,int h)
{
    std::ostringstream os;
    os << w << "x" << h;
    return os.str();
}

inline float clamp255(float v)
{
    return v<0.f ? 0.f : (v>255.f ? 255.f : v);
}

} // anon

// == [3] Géométrie ===========================================================
void fit_fill_crop(const ImageU8& src, int W, int H, ImageU8& dst)
{
    const double s = std::max((double)W/src.w, (double)H/src.h);
    const int sw = std::max(W, (int)std::lround(src.w*s));
    const int sh = std::max(H, (int)std::lround(src.h*s));
    ImageU8 scaled;
    resize_rgb_lanczos(src, sw, sh, scaled);
    crop_center_rgb(scaled, W, H, dst);
}

void fit_letterbox(const ImageU8& src, int W, int H, ImageU8& dst)
{
    const double s = std::min((double)W/src.w, (double)H/src.h);
    const int sw = std::clamp((int)std::lround(src.w*s), 1, W);
    const int sh = std::clamp((int)std::lround(src.h*s), 1, H);
    ImageU8 scaled;
    resize_rgb_lanczos(src, sw, sh, scaled);
    blit_center_rgb(scaled, W, H, dst);
}

// == [4] Gamma ===============================================================
void apply_gamma_rgb(ImageU8& img, double gamma)
{
    if(gamma==1.0) return;
    std::array<uint8_t,256> lut{};
    const double inv = 1.0/gamma;
    for(int v=0; v<256; ++v)
    {
        const long o = std::lround(std::pow(v/255.0, inv)*255.0);
        lut[(size_t)v] = (uint8_t)std::clamp<long>(o, 0, 255);
    }
    for(uint8_t& c: img.data) c = lut[c];
}

// == [5] Quantification ======================================================
bool quantize_to_palette(const ImageU8& img,
                         const PaletteTable& pal,
                         bool dither,
                         std::vector<uint8_t>& indices,
                         GalleryError* err)
{
    if(pal.count<=0)
    {
        return fail(err, ErrorKind::InvalidConfig, "Palette is empty: nothing to quantize to");
    }
    const int w=img.w, h=img.h;
    indices.assign((size_t)w*h, 0);

    if(!dither)
    {
        for(int y=0; y<h; ++y)
        {
            for(int x=0; x<w; ++x)
            {
                const uint8_t* p=img.px(x,y);
                indices[(size_t)y*w+x] = (uint8_t)nearest_palette_index(pal, p[0], p[1], p[2]);
            }
        }
        return true;
    }

    // Floyd–Steinberg, balayage ligne (gauche→droite), deux lignes d’erreur
    // avec une marge d’un pixel de chaque côté.
    //        *   7/16
    //  3/16 5/16 1/16
    const size_t rowLen = ((size_t)w+2)*3;
    std::vector<float> cur(rowLen, 0.f), nxt(rowLen, 0.f);
    for(int y=0; y<h; ++y)
    {
        for(int x=0; x<w; ++x)
        {
            const uint8_t* p=img.px(x,y);
            float* e = &cur[((size_t)x+1)*3];
            const float r = clamp255(p[0] + e[0]);
            const float g = clamp255(p[1] + e[1]);
            const float b = clamp255(p[2] + e[2]);

            const int idx = nearest_palette_index(pal, (int)std::lround(r), (int)std::lround(g), (int)std::lround(b));
            indices[(size_t)y*w+x] = (uint8_t)idx;

            const Rgb8& q = pal.slots[(size_t)idx];
            const float er = r - q.r;
            const float eg = g - q.g;
            const float eb = b - q.b;

            float* right = &cur[((size_t)x+2)*3];
            float* bl    = &nxt[((size_t)x+0)*3];
            float* bm    = &nxt[((size_t)x+1)*3];
            float* br    = &nxt[((size_t)x+2)*3];
            right[0] += er*(7.f/16.f);
            right[1] += eg*(7.f/16.f);
            right[2] += eb*(7.f/16.f);
            bl[0] += er*(3.f/16.f);
            bl[1] += eg*(3.f/16.f);
            bl[2] += eb*(3.f/16.f);
            bm[0] += er*(5.f/16.f);
            bm[1] += eg*(5.f/16.f);
            bm[2] += eb*(5.f/16.f);
            br[0] += er*(1.f/16.f);
            br[1] += eg*(1.f/16.f);
            br[2] += eb*(1.f/16.f);
        }
        cur.swap(nxt);
        std::fill(nxt.begin(), nxt.end(), 0.f);
    }
    return true;
}

// == [3..6] ==================================================================
bool render_decoded(ImageU8 img,
                    const DisplayProfile& profile,
                    const RenderOptions& opt,
                    RenderedFrame& out,
                    GalleryError* err)
{
    if(img.w<=0 || img.h<=0 || img.c!=3)
    {
        return fail(err, ErrorKind::DecodeError, "Decoded image is empty");
    }

    if(opt.resize)
    {
        ImageU8 fitted;
        if(opt.crop) fit_fill_crop(img, profile.width(), profile.height(), fitted);
        else         fit_letterbox(img, profile.width(), profile.height(), fitted);
        img.swap(fitted);
    }

    apply_gamma_rgb(img, profile.gamma());

    out.palette = build_palette_table(profile);
    if(!quantize_to_palette(img, out.palette, opt.dither, out.indices, err)) return false;

    out.rgb.w=img.w;
    out.rgb.h=img.h;
    out.rgb.c=3;
    out.rgb.data.resize((size_t)img.w*img.h*3);
    for(size_t i=0; i<out.indices.size(); ++i)
    {
        const Rgb8& c = out.palette.slots[out.indices[i]];
        out.rgb.data[i*3+0]=c.r;
        out.rgb.data[i*3+1]=c.g;
        out.rgb.data[i*3+2]=c.b;
    }

    if(!encode_png_rgb8(out.rgb, out.png))
    {
        log_error("png encode failed for " + dims(out.rgb.w, out.rgb.h) + " frame");
        return fail(err, ErrorKind::Internal, "Could not encode output image");
    }
    log_info("Processed " + dims(out.rgb.w, out.rgb.h) + " image successfully");
    return true;
}

// == [1..6] ==================================================================
bool render_image(const std::vector<uint8_t>& source,
                  const DisplayProfile& profile,
                  const RenderOptions& opt,
                  RenderedFrame& out,
                  GalleryError* err)
{
    ImageU8 img;
    if(!decode_image_rgb8(source, img, err)) return false;
    log_debug("source before orientation = " + dims(img.w, img.h));

    int orientation = 1;
    std::string why;
    switch(read_orientation_tag(source.data(), source.size(), orientation, &why))
    {
    case OrientationRead::Found:
        apply_orientation_rgb(img, orientation);
        log_debug("applied orientation " + std::to_string(orientation));
        break;
    case OrientationRead::Absent:
        log_debug("orientation left as decoded: " + why);
        break;
    case OrientationRead::Corrupt:
        log_warn("could not apply EXIF orientation, left as decoded: " + why);
        break;
    }
    log_debug("source = " + dims(img.w, img.h));

    return render_decoded(std::move(img), profile, opt, out, err);
}

} // namespace EinkGallery
