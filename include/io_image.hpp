// ============================================================================
//  File: include/io_image.hpp — Pont image RGB8 ↔ octets (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • ImageU8: tampon RGB8 entrelacé (c=3), ligne par ligne.
//  • Décodage mémoire via stb_image (JPEG/PNG/BMP/GIF/TGA/PSD/PNM), alpha
//    ignoré (req_comp=3).
//  • Encodage PNG mémoire via stb_image_write (sans perte).
//  • Outils géométriques: centrage sur canevas noir, recadrage central,
//    retournements/rotations pour l’orientation EXIF.
//
//  REMARQUES
//  ---------
//  • Une seule unité de traduction définit EINK_IO_IMAGE_IMPLEMENTATION
//    (src/compile_stb.cpp).
//  • TIFF/HEIF passent par image_decode.hpp (backends optionnels).
// ============================================================================

#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <algorithm>
#include <cstring>

#ifdef EINK_IO_IMAGE_IMPLEMENTATION
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#endif
#include "stb_image.h"
#include "stb_image_write.h"

namespace EinkGallery
{

// == [1] Type image ==========================================================
struct ImageU8
{
    int w=0,h=0,c=0;
    std::vector<uint8_t> data;

    void swap(ImageU8& o)
    {
        std::swap(w,o.w);
        std::swap(h,o.h);
        std::swap(c,o.c);
        data.swap(o.data);
    }
    uint8_t* px(int x,int y)
    {
        return &data[((size_t)y*w + x)*3];
    }
    const uint8_t* px(int x,int y) const
    {
        return &data[((size_t)y*w + x)*3];
    }
};

inline void make_canvas_rgb(int w,int h,uint8_t r,uint8_t g,uint8_t b,ImageU8& out)
{
    out.w=w;
    out.h=h;
    out.c=3;
    out.data.resize((size_t)w*h*3);
    for(size_t i=0; i<(size_t)w*h; ++i)
    {
        out.data[i*3+0]=r;
        out.data[i*3+1]=g;
        out.data[i*3+2]=b;
    }
}

// == [2] Décodage / encodage mémoire =========================================
inline bool decode_image_rgb8_stb(const uint8_t* bytes, size_t len, ImageU8& out, std::string* err=nullptr)
{
    if(!bytes || len==0 || len>(size_t)0x7fffffff)
    {
        if(err) *err="stb_image: empty or oversized buffer";
        return false;
    }
    int x=0,y=0,n=0;
    unsigned char* pix=stbi_load_from_memory(bytes, (int)len, &x,&y,&n, 3);
    if(!pix)
    {
        if(err)
        {
            const char* why = stbi_failure_reason();
            *err = std::string("stb_image: ") + (why? why : "decode failed");
        }
        return false;
    }
    out.w=x;
    out.h=y;
    out.c=3;
    out.data.assign(pix, pix+(size_t)x*y*3);
    stbi_image_free(pix);
    return true;
}

namespace detail
{
inline void append_to_vector(void* ctx, void* data, int size)
{
    auto* v = static_cast<std::vector<uint8_t>*>(ctx);
    const uint8_t* p = static_cast<const uint8_t*>(data);
    v->insert(v->end(), p, p+size);
}
} // namespace detail

inline bool encode_png_rgb8(const ImageU8& img, std::vector<uint8_t>& out)
{
    out.clear();
    if(img.w<=0 || img.h<=0 || img.c!=3) return false;
    return stbi_write_png_to_func(&detail::append_to_vector, &out,
                                  img.w, img.h, 3, img.data.data(), img.w*3)!=0;
}

// == [3] Outils image (centrage, recadrage) ==================================
// Canevas noir opaque canvasW×canvasH, src centré (décalage arrondi vers le bas).
inline void blit_center_rgb(const ImageU8& src,int canvasW,int canvasH,ImageU8& dst)
{
    dst.w=canvasW;
    dst.h=canvasH;
    dst.c=3;
    dst.data.assign((size_t)canvasW*canvasH*3,0);
    const int x0=(canvasW-src.w)/2;
    const int y0=(canvasH-src.h)/2;
    const int sx0=std::max(0,-x0);
    const int copyW=std::min(src.w-sx0, canvasW-std::max(0,x0));
    if(copyW<=0) return;
    for(int y=0; y<src.h; ++y)
    {
        if(y+y0<0 || y+y0>=canvasH) continue;
        const uint8_t* sp=&src.data[((size_t)y*src.w + sx0)*3];
        uint8_t* dp=&dst.data[((size_t)(y+y0)*canvasW + std::max(0,x0))*3];
        std::copy(sp, sp+(size_t)copyW*3, dp);
    }
}

// Fenêtre centrale subW×subH (subW≤src.w, subH≤src.h).
inline void crop_center_rgb(const ImageU8& src,int subW,int subH,ImageU8& dst)
{
    subW=std::min(subW,src.w);
    subH=std::min(subH,src.h);
    dst.w=subW;
    dst.h=subH;
    dst.c=3;
    dst.data.resize((size_t)subW*subH*3);
    const int x0=(src.w-subW)/2;
    const int y0=(src.h-subH)/2;
    for(int y=0; y<subH; ++y)
    {
        const uint8_t* sp=src.px(x0, y+y0);
        std::copy(sp, sp+(size_t)subW*3, &dst.data[(size_t)y*subW*3]);
    }
}

// == [4] Orientation =========================================================
inline void flip_horizontal_rgb(ImageU8& img)
{
    for(int y=0; y<img.h; ++y)
    {
        for(int x=0; x<img.w/2; ++x)
        {
            uint8_t* a=img.px(x,y);
            uint8_t* b=img.px(img.w-1-x,y);
            std::swap(a[0],b[0]);
            std::swap(a[1],b[1]);
            std::swap(a[2],b[2]);
        }
    }
}
inline void flip_vertical_rgb(ImageU8& img)
{
    const size_t row=(size_t)img.w*3;
    std::vector<uint8_t> tmp(row);
    for(int y=0; y<img.h/2; ++y)
    {
        uint8_t* a=&img.data[(size_t)y*row];
        uint8_t* b=&img.data[(size_t)(img.h-1-y)*row];
        std::memcpy(tmp.data(), a, row);
        std::memcpy(a, b, row);
        std::memcpy(b, tmp.data(), row);
    }
}
// Transposition (x,y)→(y,x): base des rotations 90°/270° et des orientations 5/7.
inline void transpose_rgb(ImageU8& img)
{
    ImageU8 t;
    t.w=img.h;
    t.h=img.w;
    t.c=3;
    t.data.resize(img.data.size());
    for(int y=0; y<img.h; ++y)
    {
        for(int x=0; x<img.w; ++x)
        {
            const uint8_t* s=img.px(x,y);
            uint8_t* d=t.px(y,x);
            d[0]=s[0];
            d[1]=s[1];
            d[2]=s[2];
        }
    }
    img.swap(t);
}

// Valeurs EXIF/TIFF 1..8 ; 1 ou inconnue → inchangé.
inline void apply_orientation_rgb(ImageU8& img, int orientation)
{
    switch(orientation)
    {
    case 2:
        flip_horizontal_rgb(img);
        break;
    case 3:
        flip_horizontal_rgb(img);
        flip_vertical_rgb(img);
        break;
    case 4:
        flip_vertical_rgb(img);
        break;
    case 5:
        transpose_rgb(img);
        break;
    case 6: // rotation 90° horaire
        transpose_rgb(img);
        flip_horizontal_rgb(img);
        break;
    case 7:
        transpose_rgb(img);
        flip_horizontal_rgb(img);
        flip_vertical_rgb(img);
        break;
    case 8: // rotation 90° anti-horaire
        transpose_rgb(img);
        flip_vertical_rgb(img);
        break;
    default:
        break;
    }
}

} // namespace EinkGallery
