// ============================================================================
//  File: include/exif_orientation.hpp — Lecture du tag Orientation (0x0112)
//  Project: E-Ink Gallery Renderer v1
//
//  • JPEG: segment APP1 "Exif\0\0" → en-tête TIFF → IFD0.
//  • TIFF brut: même IFD0, directement en tête de fichier.
//  • Absent: pas de tag (ou format sans EXIF). Corrupt: segment ou IFD
//    illisible. Dans les deux cas, raison dans *why; l’appelant garde alors
//    l’orientation telle que décodée.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace EinkGallery
{

constexpr uint16_t kTagOrientation = 0x0112;

enum class OrientationRead
{
    Found,
    Absent,
    Corrupt
};

// orientation ∈ 1..8 si Found.
OrientationRead read_orientation_tag(const uint8_t* data, size_t len, int& orientation,
                                     std::string* why=nullptr);

// Parcours d’un bloc TIFF (en-tête "II*\0" ou "MM\0*") déjà isolé.
OrientationRead read_tiff_ifd0_orientation(const uint8_t* tiff, size_t len, int& orientation,
                                           std::string* why=nullptr);

} // namespace EinkGallery
