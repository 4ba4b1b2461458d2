// ============================================================================
//  File: include/image_decode.hpp — Décodage source → RGB8 (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • Choix du backend par signature d’octets:
//      - TIFF ("II*\0" / "MM\0*")  → libtiff   (EINK_USE_TIFF)
//      - HEIF/AVIF (boîte ftyp)    → libheif   (EINK_USE_LIBHEIF)
//      - reste                      → stb_image
//  • Sortie toujours RGB8 (c=3), alpha et profils couleur ignorés.
//  • Un backend non compilé → DecodeError explicite (format non supporté).
//
//  DÉPENDANCES (compile-time)
//  --------------------------
//  • EINK_USE_TIFF    : libtiff (fichier temporaire RAII, supprimé sur
//                       toutes les sorties)
//  • EINK_USE_LIBHEIF : libheif (décodage mémoire, transformations
//                       irot/imir appliquées par la bibliothèque)
// ============================================================================

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "gallery_error.hpp"
#include "io_image.hpp"

namespace EinkGallery
{

enum class SourceFormat : unsigned char { Unknown=0, Jpeg, Png, Tiff, Heif, Other };

SourceFormat sniff_source_format(const uint8_t* data, size_t len);
const char*  source_format_name(SourceFormat f);

bool decode_image_rgb8(const std::vector<uint8_t>& bytes, ImageU8& out, GalleryError* err=nullptr);

} // namespace EinkGallery
