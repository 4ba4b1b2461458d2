// ============================================================================
//  File: src/image_decode.cpp — Décodage source → RGB8 (backends optionnels)
// ============================================================================

#include "image_decode.hpp"
#include "gallery_log.hpp"

#include <cstring>
#include <string>
#include <algorithm>

#if defined(EINK_USE_TIFF)
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <tiffio.h>
#endif

#if defined(EINK_USE_LIBHEIF)
#include <libheif/heif.h>
#endif

namespace EinkGallery
{

SourceFormat sniff_source_format(const uint8_t* d, size_t len)
{
    if(!d || len<4) return SourceFormat::Unknown;
    if(d[0]==0xFF && d[1]==0xD8) return SourceFormat::Jpeg;
    if(len>=8 && std::memcmp(d, "\x89PNG\r\n\x1a\n", 8)==0) return SourceFormat::Png;
    if((d[0]=='I' && d[1]=='I' && d[2]==42 && d[3]==0) ||
            (d[0]=='M' && d[1]=='M' && d[2]==0 && d[3]==42)) return SourceFormat::Tiff;
    if(len>=12 && std::memcmp(d+4, "ftyp", 4)==0)
    {
        static const char* brands[] = { "heic","heix","hevc","hevx","mif1","msf1","avif","avis" };
        for(const char* b: brands)
        {
            if(std::memcmp(d+8, b, 4)==0) return SourceFormat::Heif;
        }
    }
    return SourceFormat::Other;
}

const char* source_format_name(SourceFormat f)
{
    switch(f)
    {
    case SourceFormat::Jpeg:
        return "jpeg";
    case SourceFormat::Png:
        return "png";
    case SourceFormat::Tiff:
        return "tiff";
    case SourceFormat::Heif:
        return "heif";
    case SourceFormat::Other:
        return "other";
    default:
        return "unknown";
    }
}

// ---------------- TIFF backend
#if defined(EINK_USE_TIFF)
namespace
{

// libtiff lit depuis un chemin: copie temporaire, supprimée au destructeur.
class TempFile
{
public:
    explicit TempFile(const char* suffix)
    {
        std::random_device rd;
        std::mt19937_64 rng(((uint64_t)rd()<<32) ^ rd());
        char name[64];
        std::snprintf(name, sizeof(name), "eink_src_%016llx%s",
                      (unsigned long long)rng(), suffix);
        std::error_code ec;
        path_ = std::filesystem::temp_directory_path(ec) / name;
        if(ec) path_.clear();
    }
    ~TempFile()
    {
        if(path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if(ec) log_warn("could not remove temporary file: " + ec.message());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool write(const std::vector<uint8_t>& bytes)
    {
        if(path_.empty()) return false;
        std::ofstream f(path_, std::ios::binary | std::ios::trunc);
        if(!f) return false;
        f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
        return (bool)f;
    }
    std::string path() const
    {
        return path_.string();
    }

private:
    std::filesystem::path path_;
};

bool load_tiff_rgb(const std::vector<uint8_t>& bytes, ImageU8& out, GalleryError* err)
{
    TempFile tmp(".tif");
    if(!tmp.write(bytes))
    {
        log_error("tiff: cannot stage temporary source file");
        return fail(err, ErrorKind::IOFailure, "Could not stage source image");
    }
    TIFF* tif = TIFFOpen(tmp.path().c_str(), "r");
    if(!tif) return fail(err, ErrorKind::DecodeError, "libtiff: open failed");

    uint32_t w=0,h=0;
    uint16_t spp=0, bps=0, planar=PLANARCONFIG_CONTIG, photometric=0;
    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &w);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &h);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &spp);
    TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &bps);
    TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &planar);
    if(!TIFFGetField(tif, TIFFTAG_PHOTOMETRIC, &photometric))
    {
        TIFFClose(tif);
        return fail(err, ErrorKind::DecodeError, "libtiff: missing photometric interpretation");
    }
    // RGB (spp>=3) ou niveaux de gris MINISBLACK (spp>=1), 8 bits entrelacés
    const bool rgb  = photometric==PHOTOMETRIC_RGB && spp>=3;
    const bool gray = photometric==PHOTOMETRIC_MINISBLACK && spp>=1;
    if(w==0 || h==0 || (!rgb && !gray) || bps!=8 || planar!=PLANARCONFIG_CONTIG)
    {
        TIFFClose(tif);
        return fail(err, ErrorKind::DecodeError,
                    "libtiff: unsupported format (8-bit RGB or grayscale expected, photometric "
                    + std::to_string(photometric) + ")");
    }
    out.w=(int)w;
    out.h=(int)h;
    out.c=3;
    out.data.resize((size_t)w*h*3);
    std::vector<uint8_t> scan((size_t)TIFFScanlineSize(tif));
    for(uint32_t y=0; y<h; ++y)
    {
        if(TIFFReadScanline(tif, scan.data(), y, 0)<0)
        {
            TIFFClose(tif);
            return fail(err, ErrorKind::DecodeError, "libtiff: read scanline failed");
        }
        uint8_t* dp=&out.data[(size_t)y*w*3];
        if(rgb && spp==3) std::memcpy(dp, scan.data(), (size_t)w*3);
        else if(rgb)
        {
            for(uint32_t x=0; x<w; ++x)
            {
                dp[x*3+0]=scan[x*spp+0];
                dp[x*3+1]=scan[x*spp+1];
                dp[x*3+2]=scan[x*spp+2];
            }
        }
        else
        {
            for(uint32_t x=0; x<w; ++x)
            {
                const uint8_t v=scan[x*spp];
                dp[x*3+0]=v;
                dp[x*3+1]=v;
                dp[x*3+2]=v;
            }
        }
    }
    TIFFClose(tif);
    return true;
}

} // anon
#endif

// ---------------- HEIF backend
#if defined(EINK_USE_LIBHEIF)
namespace
{

bool load_heif_rgb(const std::vector<uint8_t>& bytes, ImageU8& out, GalleryError* err)
{
    heif_context* ctx = heif_context_alloc();
    if(!ctx) return fail(err, ErrorKind::Internal, "libheif: alloc failed");

    heif_error e = heif_context_read_from_memory_without_copy(ctx, bytes.data(), bytes.size(), nullptr);
    if(e.code!=heif_error_Ok)
    {
        heif_context_free(ctx);
        return fail(err, ErrorKind::DecodeError, "libheif: read failed");
    }

    heif_image_handle* handle=nullptr;
    e = heif_context_get_primary_image_handle(ctx, &handle);
    if(e.code!=heif_error_Ok)
    {
        heif_context_free(ctx);
        return fail(err, ErrorKind::DecodeError, "libheif: no primary image");
    }

    heif_image* img=nullptr;
    heif_decode_options* decopt = heif_decode_options_alloc();
    e = heif_decode_image(handle, &img, heif_colorspace_RGB, heif_chroma_interleaved_RGB, decopt);
    heif_decode_options_free(decopt);
    if(e.code!=heif_error_Ok)
    {
        heif_image_handle_release(handle);
        heif_context_free(ctx);
        return fail(err, ErrorKind::DecodeError, "libheif: decode failed");
    }

    int w = heif_image_get_width(img, heif_channel_interleaved);
    int h = heif_image_get_height(img, heif_channel_interleaved);
    int stride=0;
    const uint8_t* data = heif_image_get_plane_readonly(img, heif_channel_interleaved, &stride);
    if(!data || w<=0 || h<=0)
    {
        heif_image_release(img);
        heif_image_handle_release(handle);
        heif_context_free(ctx);
        return fail(err, ErrorKind::DecodeError, "libheif: plane null");
    }

    out.w=w;
    out.h=h;
    out.c=3;
    out.data.resize((size_t)w*h*3);
    for(int y=0; y<h; ++y)
    {
        std::memcpy(&out.data[(size_t)y*w*3], data + (size_t)y*stride, (size_t)w*3);
    }

    heif_image_release(img);
    heif_image_handle_release(handle);
    heif_context_free(ctx);
    return true;
}

} // anon
#endif

bool decode_image_rgb8(const std::vector<uint8_t>& bytes, ImageU8& out, GalleryError* err)
{
    if(bytes.empty()) return fail(err, ErrorKind::DecodeError, "Source image is empty");

    const SourceFormat fmt = sniff_source_format(bytes.data(), bytes.size());
    if(fmt==SourceFormat::Tiff)
    {
#if defined(EINK_USE_TIFF)
        return load_tiff_rgb(bytes, out, err);
#else
        return fail(err, ErrorKind::DecodeError, "TIFF support not compiled in");
#endif
    }
    if(fmt==SourceFormat::Heif)
    {
#if defined(EINK_USE_LIBHEIF)
        return load_heif_rgb(bytes, out, err);
#else
        return fail(err, ErrorKind::DecodeError, "HEIF support not compiled in");
#endif
    }

    std::string why;
    if(!decode_image_rgb8_stb(bytes.data(), bytes.size(), out, &why))
    {
        return fail(err, ErrorKind::DecodeError, "Cannot decode source image (" + why + ")");
    }
    return true;
}

} // namespace EinkGallery
