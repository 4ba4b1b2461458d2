// ============================================================================
//  File: src/exif_orientation.cpp — Lecture du tag Orientation (0x0112)
// ============================================================================

#include "exif_orientation.hpp"

#include <cstring>

namespace EinkGallery
{

namespace
{

OrientationRead absent(std::string* why, const char* msg)
{
    if(why) *why = msg;
    return OrientationRead::Absent;
}
OrientationRead corrupt(std::string* why, const char* msg)
{
    if(why) *why = msg;
    return OrientationRead::Corrupt;
}

uint16_t rd16(const uint8_t* p, bool le)
{
    return le ? (uint16_t)(p[0] | (p[1]<<8))
           : (uint16_t)((p[0]<<8) | p[1]);
}
uint32_t rd32(const uint8_t* p, bool le)
{
    return le ? (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24)
           : ((uint32_t)p[0]<<24) | ((uint32_t)p[1]<<16) | ((uint32_t)p[2]<<8) | (uint32_t)p[3];
}

bool is_tiff_header(const uint8_t* p, size_t len)
{
    if(len<8) return false;
    return (p[0]=='I' && p[1]=='I' && p[2]==42 && p[3]==0) ||
           (p[0]=='M' && p[1]=='M' && p[2]==0 && p[3]==42);
}

} // anon

OrientationRead read_tiff_ifd0_orientation(const uint8_t* tiff, size_t len, int& orientation, std::string* why)
{
    if(!is_tiff_header(tiff, len))
        return corrupt(why, "exif: bad TIFF header");
    const bool le = (tiff[0]=='I');
    const uint32_t ifd = rd32(tiff+4, le);
    if((size_t)ifd+2 > len)
        return corrupt(why, "exif: IFD0 out of range");
    const uint16_t n = rd16(tiff+ifd, le);
    for(uint16_t i=0; i<n; ++i)
    {
        const size_t e = (size_t)ifd + 2 + (size_t)i*12;
        if(e+12 > len)
            return corrupt(why, "exif: truncated IFD0");
        if(rd16(tiff+e, le)!=kTagOrientation) continue;
        const uint16_t type  = rd16(tiff+e+2, le);
        const uint32_t count = rd32(tiff+e+4, le);
        if(type!=3 || count<1) // SHORT attendu
            return corrupt(why, "exif: orientation has unexpected type");
        const uint16_t v = rd16(tiff+e+8, le);
        if(v<1 || v>8)
            return corrupt(why, "exif: orientation value out of range");
        orientation = (int)v;
        return OrientationRead::Found;
    }
    return absent(why, "exif: no orientation tag");
}

OrientationRead read_orientation_tag(const uint8_t* data, size_t len, int& orientation, std::string* why)
{
    if(!data || len<4)
        return absent(why, "exif: buffer too small");
    if(is_tiff_header(data, len)) return read_tiff_ifd0_orientation(data, len, orientation, why);

    if(!(data[0]==0xFF && data[1]==0xD8))
        return absent(why, "exif: no orientation metadata for this format");

    // Segments JPEG jusqu’à SOS
    size_t p = 2;
    while(p+4 <= len)
    {
        if(data[p]!=0xFF)
            return corrupt(why, "exif: corrupt JPEG marker stream");
        const uint8_t marker = data[p+1];
        if(marker==0xFF)
        {
            ++p; // remplissage
            continue;
        }
        if(marker==0xDA || marker==0xD9) break; // SOS / EOI
        if(marker==0x01 || (marker>=0xD0 && marker<=0xD7))
        {
            p += 2;
            continue;
        }
        const size_t seg = ((size_t)data[p+2]<<8) | data[p+3];
        if(seg<2 || p+2+seg > len)
            return corrupt(why, "exif: truncated JPEG segment");
        const uint8_t* body = data+p+4;
        const size_t blen = seg-2;
        if(marker==0xE1 && blen>=6 && std::memcmp(body, "Exif\0\0", 6)==0)
        {
            return read_tiff_ifd0_orientation(body+6, blen-6, orientation, why);
        }
        p += 2+seg;
    }
    return absent(why, "exif: no EXIF segment");
}

} // namespace EinkGallery
