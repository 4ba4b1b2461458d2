// ============================================================================
//  File: include/resample.hpp — Rééchantillonnage Lanczos-3 séparable
//  Project: E-Ink Gallery Renderer v1
//
//  • Filtre élargi d’un facteur 1/scale en réduction (moyenne de zone), noyau
//    nominal en agrandissement. Poids normalisés par pixel de sortie.
//  • Deux passes (horizontale puis verticale) en flottant, arrondi + clamp.
// ============================================================================

#pragma once
#include "io_image.hpp"

namespace EinkGallery
{

void resize_rgb_lanczos(const ImageU8& src, int dstW, int dstH, ImageU8& dst);

} // namespace EinkGallery
