// ============================================================================
//  File: include/render_pipeline.hpp — Rendu photo → bitmap panneau (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  Fonction pure (octets source, profil, options) → RenderedFrame.
//  Aucun état partagé: appelable en parallèle depuis plusieurs workers.
//
//  ÉTAPES (ordre fixe)
//  -------------------
//   1. Décodage RGB8 (image_decode.hpp).
//   2. Orientation EXIF/TIFF; lecture ratée → journalisée, on continue.
//   3. resize: crop=true  → couvre W×H (facteur max) puis recadrage central;
//              crop=false → tient dans W×H (facteur min), canevas noir centré.
//   4. gamma ≠ 1.0: out = round(255·(in/255)^(1/gamma)), clamp. 1.0 = identité
//      stricte (aucune passe flottante).
//   5. Quantification palette (distance euclidienne RGB, égalité → plus petit
//      index), Floyd–Steinberg optionnel en ordre ligne (7/16, 3/16, 5/16, 1/16).
//   6. Encodage PNG sans perte.
//
//  ERREURS
//  -------
//   • DecodeError  : source illisible
//   • InvalidConfig: palette vide (jamais de succès silencieux)
// ============================================================================

#pragma once
#include <cstdint>
#include <vector>

#include "display_profile.hpp"
#include "gallery_error.hpp"
#include "io_image.hpp"
#include "palette_table.hpp"

namespace EinkGallery
{

struct RenderOptions
{
    bool dither = true;
    bool resize = true;
    bool crop   = true;  // false → letterbox
};

struct RenderedFrame
{
    ImageU8              rgb;      // couleurs de palette uniquement
    std::vector<uint8_t> indices;  // w*h, index dans `palette`
    PaletteTable         palette;
    std::vector<uint8_t> png;
};

// --- Pipeline complet
bool render_image(const std::vector<uint8_t>& source,
                  const DisplayProfile& profile,
                  const RenderOptions& opt,
                  RenderedFrame& out,
                  GalleryError* err = nullptr);

// --- Étapes 3..6 sur une image déjà décodée et orientée
bool render_decoded(ImageU8 img,
                    const DisplayProfile& profile,
                    const RenderOptions& opt,
                    RenderedFrame& out,
                    GalleryError* err = nullptr);

// --- Étapes individuelles
void fit_fill_crop(const ImageU8& src, int W, int H, ImageU8& dst);
void fit_letterbox(const ImageU8& src, int W, int H, ImageU8& dst);
void apply_gamma_rgb(ImageU8& img, double gamma);
bool quantize_to_palette(const ImageU8& img,
                         const PaletteTable& pal,
                         bool dither,
                         std::vector<uint8_t>& indices,
                         GalleryError* err = nullptr);

} // namespace EinkGallery
