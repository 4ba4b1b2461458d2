// ============================================================================
//  File: src/minitest_render.cpp — Mini-tests pipeline de rendu
//  Run:
//    ./minitest_render
//
//  Images synthétiques uniquement (PNG/JPEG encodés en mémoire via stb).
// ============================================================================

#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <cstdint>
#include <cstring>
#include <algorithm>

#include "display_profile.hpp"
#include "exif_orientation.hpp"
#include "gallery_log.hpp"
#include "image_decode.hpp"
#include "io_image.hpp"
#include "palette_table.hpp"
#include "render_pipeline.hpp"
#include "resample.hpp"

using namespace EinkGallery;

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static const std::vector<Rgb8> kBW     = { {0,0,0}, {255,255,255} };
static const std::vector<Rgb8> kSeven  = { {0,0,0}, {255,255,255}, {0,255,0}, {0,0,255},
                                           {255,0,0}, {255,255,0}, {255,128,0} };

// Dégradé diagonal coloré
static void make_gradient(int w,int h, ImageU8& out)
{
    out.w=w;
    out.h=h;
    out.c=3;
    out.data.assign((size_t)w*h*3,0);
    for(int y=0; y<h; ++y)
    {
        for(int x=0; x<w; ++x)
        {
            uint8_t* p=out.px(x,y);
            p[0]=(uint8_t)(255*x/std::max(1,w-1));
            p[1]=(uint8_t)(255*y/std::max(1,h-1));
            p[2]=(uint8_t)((p[0]+p[1])/2);
        }
    }
}

static bool in_palette(const ImageU8& img, const std::vector<Rgb8>& pal)
{
    for(size_t i=0; i+2<img.data.size(); i+=3)
    {
        const Rgb8 c{img.data[i], img.data[i+1], img.data[i+2]};
        if(std::find(pal.begin(), pal.end(), c)==pal.end()) return false;
    }
    return true;
}

static bool is_color(const ImageU8& img, int x,int y, uint8_t r,uint8_t g,uint8_t b)
{
    const uint8_t* p=img.px(x,y);
    return p[0]==r && p[1]==g && p[2]==b;
}

static std::vector<uint8_t> to_png(const ImageU8& img)
{
    std::vector<uint8_t> png;
    encode_png_rgb8(img, png);
    return png;
}

// JPEG + segment APP1 Exif (big-endian) portant l’orientation demandée.
static std::vector<uint8_t> jpeg_with_orientation(const ImageU8& img, uint16_t orientation)
{
    std::vector<uint8_t> jpg;
    stbi_write_jpg_to_func(&detail::append_to_vector, &jpg, img.w, img.h, 3, img.data.data(), 95);
    const uint8_t app1[] =
    {
        0xFF,0xE1, 0x00,0x22,
        'E','x','i','f',0,0,
        'M','M',0x00,0x2A, 0x00,0x00,0x00,0x08,
        0x00,0x01,
        0x01,0x12, 0x00,0x03, 0x00,0x00,0x00,0x01, (uint8_t)(orientation>>8),(uint8_t)orientation, 0x00,0x00,
        0x00,0x00,0x00,0x00
    };
    std::vector<uint8_t> out(jpg.begin(), jpg.begin()+2); // SOI
    out.insert(out.end(), app1, app1+sizeof(app1));
    out.insert(out.end(), jpg.begin()+2, jpg.end());
    return out;
}

// ------------------ TEST A : gamma --------------------------------------------
static bool test_gamma_identity()
{
    ImageU8 img;
    make_gradient(37, 23, img);
    const std::vector<uint8_t> before = img.data;
    apply_gamma_rgb(img, 1.0);
    T_ASSERT( img.data==before );
    return true;
}

static bool test_gamma_curve()
{
    ImageU8 img;
    make_canvas_rgb(3, 1, 0,0,0, img);
    img.data = { 0,0,0, 128,128,128, 255,255,255 };
    apply_gamma_rgb(img, 2.2);
    T_ASSERT( img.data[0]==0 );
    T_ASSERT( img.data[3]>170 && img.data[3]<200 ); // ≈186
    T_ASSERT( img.data[6]==255 );
    return true;
}

// ------------------ TEST B : quantification ---------------------------------
static bool test_palette_subset(bool dither)
{
    auto prof = DisplayProfile::create("seven", 64, 48, kSeven, 1.0);
    T_ASSERT( prof.has_value() );
    ImageU8 src;
    make_gradient(120, 90, src);

    RenderOptions opt;
    opt.dither = dither;
    RenderedFrame f;
    GalleryError e;
    T_ASSERT( render_image(to_png(src), *prof, opt, f, &e) );
    T_ASSERT( f.rgb.w==64 && f.rgb.h==48 );
    T_ASSERT( in_palette(f.rgb, kSeven) );
    T_ASSERT( f.indices.size()==(size_t)64*48 );
    for(uint8_t i: f.indices) T_ASSERT( i<kSeven.size() );

    // PNG produit relu: mêmes dimensions, couleurs de palette uniquement
    ImageU8 back;
    T_ASSERT( decode_image_rgb8(f.png, back, &e) );
    T_ASSERT( back.w==64 && back.h==48 );
    T_ASSERT( back.data==f.rgb.data );
    return true;
}

static bool test_dither_spreads_error()
{
    ImageU8 gray;
    make_canvas_rgb(64, 64, 128,128,128, gray);
    PaletteTable pal = build_palette_table(kBW);

    std::vector<uint8_t> flat, fs;
    T_ASSERT( quantize_to_palette(gray, pal, false, flat) );
    T_ASSERT( quantize_to_palette(gray, pal, true, fs) );

    // sans diffusion: chaque pixel indépendamment → tout blanc (128 plus près de 255)
    T_ASSERT( std::count(flat.begin(), flat.end(), (uint8_t)1)==(long)flat.size() );
    // Floyd–Steinberg: mélange ≈ 50 %
    const long whites = (long)std::count(fs.begin(), fs.end(), (uint8_t)1);
    T_ASSERT( whites > (long)fs.size()*40/100 && whites < (long)fs.size()*60/100 );
    return true;
}

static bool test_empty_palette_fails()
{
    ImageU8 img;
    make_canvas_rgb(4, 4, 10,10,10, img);
    PaletteTable empty;
    std::vector<uint8_t> idx;
    GalleryError e;
    T_ASSERT( !quantize_to_palette(img, empty, true, idx, &e) );
    T_ASSERT( e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !quantize_to_palette(img, empty, false, idx, &e) );
    return true;
}

// ------------------ TEST C : géométrie ----------------------------------------
static bool test_resample_constant()
{
    ImageU8 src, dst;
    make_canvas_rgb(50, 30, 200,100,50, src);
    resize_rgb_lanczos(src, 17, 61, dst);
    T_ASSERT( dst.w==17 && dst.h==61 && dst.c==3 );
    for(int y=0; y<dst.h; ++y)
        for(int x=0; x<dst.w; ++x)
            T_ASSERT( is_color(dst, x,y, 200,100,50) );
    return true;
}

static bool test_crop_dimensions()
{
    auto prof = DisplayProfile::create("bw", 64, 48, kBW, 1.0);
    T_ASSERT( prof.has_value() );
    ImageU8 white;
    make_canvas_rgb(200, 100, 255,255,255, white);

    RenderOptions opt;
    opt.crop = true;
    opt.dither = false;
    RenderedFrame f;
    T_ASSERT( render_decoded(white, *prof, opt, f) );
    T_ASSERT( f.rgb.w==64 && f.rgb.h==48 );
    // remplissage: aucune bordure
    for(int y=0; y<48; ++y)
        for(int x=0; x<64; ++x)
            T_ASSERT( is_color(f.rgb, x,y, 255,255,255) );
    return true;
}

// Source blanche 200x100 → 64x48 : contenu 64x32 centré, bandes noires de 8.
static bool test_letterbox_wide()
{
    auto prof = DisplayProfile::create("bw", 64, 48, kBW, 1.0);
    T_ASSERT( prof.has_value() );
    ImageU8 white;
    make_canvas_rgb(200, 100, 255,255,255, white);

    RenderOptions opt;
    opt.crop = false;
    opt.dither = false;
    RenderedFrame f;
    T_ASSERT( render_decoded(white, *prof, opt, f) );
    T_ASSERT( f.rgb.w==64 && f.rgb.h==48 );

    int top=-1, bottom=-1;
    for(int y=0; y<48; ++y)
    {
        const bool rowWhite = is_color(f.rgb, 32,y, 255,255,255);
        if(rowWhite && top<0) top=y;
        if(rowWhite) bottom=y;
        if(!rowWhite) T_ASSERT( is_color(f.rgb, 32,y, 0,0,0) );
    }
    T_ASSERT( top>=0 );
    const int contentH = bottom-top+1;
    // ratio conservé à un pixel près: 64/2 = 32
    T_ASSERT( contentH>=31 && contentH<=33 );
    T_ASSERT( top>=7 && top<=9 );
    for(int x=0; x<64; ++x)
    {
        T_ASSERT( is_color(f.rgb, x,0, 0,0,0) );
        T_ASSERT( is_color(f.rgb, x,47, 0,0,0) );
    }
    return true;
}

// Source haute 100x200 → 64x48 : contenu 24x48, bandes verticales noires.
static bool test_letterbox_tall()
{
    auto prof = DisplayProfile::create("bw", 64, 48, kBW, 1.0);
    T_ASSERT( prof.has_value() );
    ImageU8 white;
    make_canvas_rgb(100, 200, 255,255,255, white);

    RenderOptions opt;
    opt.crop = false;
    opt.dither = false;
    RenderedFrame f;
    T_ASSERT( render_decoded(white, *prof, opt, f) );
    T_ASSERT( f.rgb.w==64 && f.rgb.h==48 );

    int left=-1, right=-1;
    for(int x=0; x<64; ++x)
    {
        if(is_color(f.rgb, x,24, 255,255,255))
        {
            if(left<0) left=x;
            right=x;
        }
    }
    const int contentW = right-left+1;
    T_ASSERT( contentW>=23 && contentW<=25 );
    T_ASSERT( is_color(f.rgb, 0,24, 0,0,0) );
    T_ASSERT( is_color(f.rgb, 63,24, 0,0,0) );
    return true;
}

// Petite source agrandie en letterbox (facteur min, jamais de recadrage).
static bool test_letterbox_upscale()
{
    auto prof = DisplayProfile::create("bw", 64, 48, kBW, 1.0);
    T_ASSERT( prof.has_value() );
    ImageU8 white;
    make_canvas_rgb(16, 16, 255,255,255, white);

    RenderOptions opt;
    opt.crop = false;
    opt.dither = false;
    RenderedFrame f;
    T_ASSERT( render_decoded(white, *prof, opt, f) );
    T_ASSERT( is_color(f.rgb, 32,0, 255,255,255) );
    T_ASSERT( is_color(f.rgb, 32,47, 255,255,255) );
    T_ASSERT( is_color(f.rgb, 0,24, 0,0,0) );
    T_ASSERT( is_color(f.rgb, 63,24, 0,0,0) );
    return true;
}

// ------------------ TEST D : orientation EXIF ---------------------------------
static void make_indexed(ImageU8& img)
{
    make_canvas_rgb(3, 2, 0,0,0, img);
    for(int y=0; y<2; ++y)
        for(int x=0; x<3; ++x)
            img.px(x,y)[0]=(uint8_t)(x*10+y);
}

static bool test_orientation_transforms()
{
    struct Case
    {
        int o, w, h;
        uint8_t tl; // pixel (0,0) attendu = x*10+y de la source
    };
    const Case cases[] =
    {
        {1, 3,2,  0}, {2, 3,2, 20}, {3, 3,2, 21}, {4, 3,2,  1},
        {5, 2,3,  0}, {6, 2,3,  1}, {7, 2,3, 21}, {8, 2,3, 20}
    };
    for(const Case& c: cases)
    {
        ImageU8 img;
        make_indexed(img);
        apply_orientation_rgb(img, c.o);
        if(img.w!=c.w || img.h!=c.h || img.px(0,0)[0]!=c.tl)
        {
            std::cerr<<"  orientation "<<c.o<<" -> "<<img.w<<"x"<<img.h<<" tl="<<(int)img.px(0,0)[0]<<"\n";
            return false;
        }
    }
    return true;
}

static bool test_exif_parse()
{
    // TIFF brut little-endian, orientation 3
    const uint8_t le[] =
    {
        'I','I',0x2A,0x00, 0x08,0x00,0x00,0x00,
        0x01,0x00,
        0x12,0x01, 0x03,0x00, 0x01,0x00,0x00,0x00, 0x03,0x00,0x00,0x00,
        0x00,0x00,0x00,0x00
    };
    int o=0;
    std::string why;
    T_ASSERT( read_orientation_tag(le, sizeof(le), o, &why)==OrientationRead::Found && o==3 );

    // valeur hors 1..8 → refus
    uint8_t bad[sizeof(le)];
    std::memcpy(bad, le, sizeof(le));
    bad[18]=9;
    T_ASSERT( read_orientation_tag(bad, sizeof(bad), o, &why)==OrientationRead::Corrupt );

    // IFD tronqué
    T_ASSERT( read_orientation_tag(le, 12, o, &why)==OrientationRead::Corrupt );

    // PNG: pas de métadonnée d’orientation
    ImageU8 img;
    make_canvas_rgb(4, 4, 1,2,3, img);
    const std::vector<uint8_t> png = to_png(img);
    T_ASSERT( read_orientation_tag(png.data(), png.size(), o, &why)==OrientationRead::Absent );

    // JPEG + APP1
    const std::vector<uint8_t> jpg = jpeg_with_orientation(img, 6);
    T_ASSERT( read_orientation_tag(jpg.data(), jpg.size(), o, &why)==OrientationRead::Found && o==6 );

    // IFD0 sans tag 0x0112
    uint8_t noTag[sizeof(le)];
    std::memcpy(noTag, le, sizeof(le));
    noTag[10]=0x00;
    noTag[11]=0x01;
    T_ASSERT( read_orientation_tag(noTag, sizeof(noTag), o, &why)==OrientationRead::Absent );

    // JPEG sans APP1
    std::vector<uint8_t> plain;
    stbi_write_jpg_to_func(&detail::append_to_vector, &plain, img.w, img.h, 3, img.data.data(), 90);
    T_ASSERT( read_orientation_tag(plain.data(), plain.size(), o, &why)==OrientationRead::Absent );
    return true;
}

// 40x20: moitié gauche rouge, droite bleue. Orientation 6 (90° horaire)
// → 20x40, haut rouge, bas bleu.
static bool test_render_applies_orientation()
{
    ImageU8 src;
    make_canvas_rgb(40, 20, 0,0,255, src);
    for(int y=0; y<20; ++y)
        for(int x=0; x<20; ++x)
        {
            uint8_t* p=src.px(x,y);
            p[0]=255;
            p[1]=0;
            p[2]=0;
        }
    const std::vector<uint8_t> jpg = jpeg_with_orientation(src, 6);

    auto prof = DisplayProfile::create("tall", 20, 40,
                                       { {0,0,0}, {255,255,255}, {255,0,0}, {0,0,255} }, 1.0);
    T_ASSERT( prof.has_value() );
    RenderOptions opt;
    opt.dither = false;
    RenderedFrame f;
    GalleryError e;
    T_ASSERT( render_image(jpg, *prof, opt, f, &e) );
    T_ASSERT( f.rgb.w==20 && f.rgb.h==40 );
    T_ASSERT( is_color(f.rgb, 10,5, 255,0,0) );
    T_ASSERT( is_color(f.rgb, 10,34, 0,0,255) );
    return true;
}

// EXIF illisible: rendu quand même, avec un avertissement; absence de tag: silence.
static bool render_and_capture(const std::vector<uint8_t>& src, std::string& logged)
{
    auto prof = DisplayProfile::create("log", 8, 8, kBW, 1.0);
    T_ASSERT( prof.has_value() );
    RenderOptions opt;
    RenderedFrame f;
    GalleryError e;
    std::ostringstream cap;
    std::streambuf* old = std::cerr.rdbuf(cap.rdbuf());
    const bool ok = render_image(src, *prof, opt, f, &e);
    std::cerr.rdbuf(old);
    logged = cap.str();
    T_ASSERT( ok );
    return true;
}

static bool test_orientation_warnings()
{
    ImageU8 img;
    make_gradient(16, 16, img);
    std::vector<uint8_t> jpg = jpeg_with_orientation(img, 6);
    jpg[19] = 0x40; // offset IFD0 hors du segment
    int o=0;
    T_ASSERT( read_orientation_tag(jpg.data(), jpg.size(), o)==OrientationRead::Corrupt );

    std::string logged;
    T_ASSERT( render_and_capture(jpg, logged) );
    T_ASSERT( logged.find("[WARN]")!=std::string::npos );

    T_ASSERT( render_and_capture(to_png(img), logged) );
    T_ASSERT( logged.find("[WARN]")==std::string::npos );
    return true;
}

// ------------------ TEST E : décodage -----------------------------------------
static bool test_decode_errors()
{
    auto prof = DisplayProfile::create("bw", 8, 8, kBW, 1.0);
    T_ASSERT( prof.has_value() );
    RenderOptions opt;
    RenderedFrame f;
    GalleryError e;

    const std::vector<uint8_t> junk = { 'n','o','t',' ','a','n',' ','i','m','a','g','e' };
    T_ASSERT( !render_image(junk, *prof, opt, f, &e) && e.kind==ErrorKind::DecodeError );
    T_ASSERT( !render_image(std::vector<uint8_t>(), *prof, opt, f, &e) && e.kind==ErrorKind::DecodeError );

    // PNG tronqué
    ImageU8 img;
    make_gradient(32, 32, img);
    std::vector<uint8_t> png = to_png(img);
    png.resize(png.size()/3);
    T_ASSERT( !render_image(png, *prof, opt, f, &e) && e.kind==ErrorKind::DecodeError );
    return true;
}

static bool test_sniff()
{
    ImageU8 img;
    make_canvas_rgb(2, 2, 0,0,0, img);
    const std::vector<uint8_t> png = to_png(img);
    T_ASSERT( sniff_source_format(png.data(), png.size())==SourceFormat::Png );
    const std::vector<uint8_t> jpg = jpeg_with_orientation(img, 1);
    T_ASSERT( sniff_source_format(jpg.data(), jpg.size())==SourceFormat::Jpeg );
    const uint8_t tif[] = { 'M','M',0,42, 0,0,0,8 };
    T_ASSERT( sniff_source_format(tif, sizeof(tif))==SourceFormat::Tiff );
    const uint8_t heic[] = { 0,0,0,24, 'f','t','y','p', 'h','e','i','c', 0,0,0,0 };
    T_ASSERT( sniff_source_format(heic, sizeof(heic))==SourceFormat::Heif );
    T_ASSERT( std::strcmp(source_format_name(SourceFormat::Heif), "heif")==0 );
    return true;
}

// TIFF baseline non compressé, une seule bande, little-endian (spp 1, 3 ou 4).
static std::vector<uint8_t> make_tiff(uint32_t w, uint32_t h, uint16_t spp, uint16_t photometric,
                                      const std::vector<uint8_t>& pixels)
{
    std::vector<uint8_t> t;
    auto put16=[&](uint16_t v){ t.push_back((uint8_t)(v&0xFF)); t.push_back((uint8_t)(v>>8)); };
    auto put32=[&](uint32_t v){ put16((uint16_t)(v&0xFFFF)); put16((uint16_t)(v>>16)); };

    const uint16_t nEntries = 9;
    const uint32_t ifdEnd   = 8 + 2 + nEntries*12 + 4;
    const uint32_t bpsAt    = ifdEnd;
    const uint32_t pixAt    = ifdEnd + (spp>2 ? spp*2u : 0u);

    t.push_back('I');
    t.push_back('I');
    put16(42);
    put32(8);
    put16(nEntries);
    auto entry=[&](uint16_t tag, uint16_t type, uint32_t count, uint32_t value)
    {
        put16(tag);
        put16(type);
        put32(count);
        if(type==3 && count==1)
        {
            put16((uint16_t)value);
            put16(0);
        }
        else put32(value);
    };
    entry(256, 4, 1, w);
    entry(257, 4, 1, h);
    if(spp>2) entry(258, 3, spp, bpsAt);
    else entry(258, 3, 1, 8);
    entry(259, 3, 1, 1);
    entry(262, 3, 1, photometric);
    entry(273, 4, 1, pixAt);
    entry(277, 3, 1, spp);
    entry(278, 4, 1, h);
    entry(279, 4, 1, (uint32_t)pixels.size());
    put32(0);
    if(spp>2) for(uint16_t i=0; i<spp; ++i) put16(8);
    t.insert(t.end(), pixels.begin(), pixels.end());
    return t;
}

static bool test_tiff_decode()
{
    const std::vector<uint8_t> rgbPix  = { 10,20,30, 200,150,100 };
    const std::vector<uint8_t> grayPix = { 10, 200 };
    const std::vector<uint8_t> cmykPix = { 0,255,255,0, 255,0,0,0 };
    const std::vector<uint8_t> rgb  = make_tiff(2, 1, 3, 2, rgbPix);   // PHOTOMETRIC_RGB
    const std::vector<uint8_t> gray = make_tiff(2, 1, 1, 1, grayPix);  // MINISBLACK
    const std::vector<uint8_t> cmyk = make_tiff(2, 1, 4, 5, cmykPix);  // SEPARATED
    const std::vector<uint8_t> ycc  = make_tiff(2, 1, 3, 6, rgbPix);   // YCBCR
    T_ASSERT( sniff_source_format(rgb.data(), rgb.size())==SourceFormat::Tiff );

    ImageU8 img;
    GalleryError e;
#if defined(EINK_USE_TIFF)
    T_ASSERT( decode_image_rgb8(rgb, img, &e) );
    T_ASSERT( img.w==2 && img.h==1 && img.c==3 );
    T_ASSERT( img.data==rgbPix );

    T_ASSERT( decode_image_rgb8(gray, img, &e) );
    T_ASSERT( img.w==2 && img.h==1 && img.c==3 );
    const std::vector<uint8_t> grayRgb = { 10,10,10, 200,200,200 };
    T_ASSERT( img.data==grayRgb );

    T_ASSERT( !decode_image_rgb8(cmyk, img, &e) && e.kind==ErrorKind::DecodeError );
    T_ASSERT( !decode_image_rgb8(ycc, img, &e) && e.kind==ErrorKind::DecodeError );
#else
    T_ASSERT( !decode_image_rgb8(gray, img, &e) && e.kind==ErrorKind::DecodeError );
    T_ASSERT( !decode_image_rgb8(cmyk, img, &e) && e.kind==ErrorKind::DecodeError );
    (void)ycc;
#endif
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    set_log_level(LogLevel::Warn);
    bool ok = true;

    ok &= test_gamma_identity();
    ok &= test_gamma_curve();
    std::cout << "[A] gamma : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_palette_subset(true);
    ok &= test_palette_subset(false);
    ok &= test_dither_spreads_error();
    ok &= test_empty_palette_fails();
    std::cout << "[B] quantization : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_resample_constant();
    ok &= test_crop_dimensions();
    ok &= test_letterbox_wide();
    ok &= test_letterbox_tall();
    ok &= test_letterbox_upscale();
    std::cout << "[C] geometry : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_orientation_transforms();
    ok &= test_exif_parse();
    ok &= test_render_applies_orientation();
    ok &= test_orientation_warnings();
    std::cout << "[D] orientation : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_decode_errors();
    ok &= test_sniff();
    ok &= test_tiff_decode();
    std::cout << "[E] decode : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
